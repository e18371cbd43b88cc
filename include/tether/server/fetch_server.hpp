#pragma once

#include "tether/network/tcp_server.hpp"
#include "tether/server/fetch_service.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace tether::server {

struct ServerSettings {
    std::string bind_address = "0.0.0.0";
    std::uint16_t port = 8080;
    std::chrono::milliseconds sweep_interval{5000};
    
    static ServerSettings from_config(const core::Config& config);
};

// Listener, dispatch and idle-session sweeper for the fetch service
class FetchServer {
public:
    FetchServer(ServerSettings settings, ServiceOptions options);
    ~FetchServer();
    
    FetchServer(const FetchServer&) = delete;
    FetchServer& operator=(const FetchServer&) = delete;
    
    bool start();
    void stop();
    
    bool is_running() const { return running_; }
    std::uint16_t get_port() const { return tcp_server_->get_port(); }
    FetchService& get_service() { return service_; }

private:
    void sweep_loop();
    
    ServerSettings settings_;
    FetchService service_;
    std::unique_ptr<network::TcpServer> tcp_server_;
    
    std::atomic<bool> running_;
    std::thread sweep_thread_;
    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
};

}
