#include "tether/app/shutdown_signal.hpp"
#include "tether/core/logger.hpp"
#include <csignal>

namespace tether::app {

ShutdownSignal::ShutdownSignal()
    : io_context_()
    , signals_(io_context_)
    , triggered_(false) {
}

ShutdownSignal::~ShutdownSignal() {
    if (signal_thread_.joinable()) {
        boost::asio::post(io_context_, [this]() {
            boost::system::error_code ec;
            signals_.cancel(ec);
        });
        signal_thread_.join();
    }
}

void ShutdownSignal::install() {
    if (signal_thread_.joinable()) {
        return;
    }
    
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (error) {
            return;
        }
        LOG_INFO("Received signal {}, shutting down", signal_number);
        trigger();
    });
    
    signal_thread_ = std::thread([this]() { io_context_.run(); });
}

void ShutdownSignal::trigger() {
    std::lock_guard<std::mutex> lock(mutex_);
    triggered_ = true;
    cv_.notify_all();
}

void ShutdownSignal::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return triggered_.load(); });
}

bool ShutdownSignal::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return triggered_.load(); });
}

}
