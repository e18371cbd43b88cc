#pragma once

#include <utility> // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace tether::app {

// Turns SIGINT/SIGTERM into a flag commands can wait on
class ShutdownSignal {
public:
    ShutdownSignal();
    ~ShutdownSignal();
    
    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;
    
    // Starts listening for process signals
    void install();
    
    void trigger();
    bool is_triggered() const { return triggered_; }
    
    void wait();
    
    // Returns true when triggered before the timeout elapsed
    bool wait_for(std::chrono::milliseconds timeout);

private:
    boost::asio::io_context io_context_;
    boost::asio::signal_set signals_;
    std::thread signal_thread_;
    
    std::atomic<bool> triggered_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

}
