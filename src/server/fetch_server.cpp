#include "tether/server/fetch_server.hpp"
#include "tether/core/logger.hpp"

namespace tether::server {

ServerSettings ServerSettings::from_config(const core::Config& config) {
    ServerSettings settings;
    settings.bind_address = config.get_string("server.bind_address", "0.0.0.0");
    settings.port = static_cast<std::uint16_t>(config.get_int("server.port", 8080));
    settings.sweep_interval = std::chrono::milliseconds(
        config.get_uint64("server.sweep_interval_ms", 5000));
    return settings;
}

FetchServer::FetchServer(ServerSettings settings, ServiceOptions options)
    : settings_(std::move(settings))
    , service_(std::move(options))
    , tcp_server_(std::make_unique<network::TcpServer>(settings_.bind_address, settings_.port))
    , running_(false) {
    
    tcp_server_->set_connection_handler([](std::shared_ptr<network::Connection> connection) {
        LOG_INFO("Client connected from {}", connection->get_remote_endpoint());
    });
    
    tcp_server_->set_envelope_handler(
        [this](std::shared_ptr<network::Connection> connection, network::Envelope envelope) {
            service_.handle_envelope(connection, envelope);
        });
    
    tcp_server_->set_disconnect_handler([this](std::shared_ptr<network::Connection> connection) {
        service_.handle_disconnect(connection);
    });
}

FetchServer::~FetchServer() {
    stop();
}

bool FetchServer::start() {
    if (running_) {
        return false;
    }
    
    if (!tcp_server_->start()) {
        return false;
    }
    
    running_ = true;
    sweep_thread_ = std::thread([this]() { sweep_loop(); });
    
    LOG_INFO("Fetch server listening on {}:{}, saving to {}", settings_.bind_address,
             tcp_server_->get_port(), service_.get_options().assembler.download_dir.string());
    return true;
}

void FetchServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        sweep_cv_.notify_all();
    }
    
    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
    
    tcp_server_->stop();
}

void FetchServer::sweep_loop() {
    std::unique_lock<std::mutex> lock(sweep_mutex_);
    
    while (running_) {
        if (sweep_cv_.wait_for(lock, settings_.sweep_interval, [this]() { return !running_; })) {
            break;
        }
        
        lock.unlock();
        auto expired = service_.expire_idle_sessions();
        if (expired > 0) {
            LOG_WARN("Expired {} idle download(s)", expired);
        }
        lock.lock();
    }
}

}
