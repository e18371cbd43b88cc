#pragma once

#include "tether/client/fetch_agent.hpp"
#include "tether/network/tcp_client.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace tether::client {

struct ClientSettings {
    std::string server_host = "localhost";
    std::uint16_t server_port = 8080;
    std::chrono::milliseconds reconnect_interval{5000};
    std::chrono::milliseconds connect_timeout{10000};
    
    static ClientSettings from_config(const core::Config& config);
};

// Keeps one connection to the server alive and hands it to a FetchAgent
class TetherClient {
public:
    TetherClient(ClientSettings settings, AgentOptions options,
                 FetchAgent::SourceFactory source_factory = nullptr);
    ~TetherClient();
    
    TetherClient(const TetherClient&) = delete;
    TetherClient& operator=(const TetherClient&) = delete;
    
    // Connects, serves until disconnected, then waits the reconnect
    // interval and tries again. Returns once stop() is called.
    void run();
    
    // Connects and serves a single connection; false if the connect failed
    bool run_once();
    
    // Safe from any thread; a stopped client does not run again
    void stop();
    
    bool is_running() const { return running_; }
    bool is_connected() const;
    FetchAgent& get_agent() { return agent_; }

private:
    bool wait_before_reconnect();
    
    ClientSettings settings_;
    FetchAgent agent_;
    
    std::atomic<bool> running_;
    std::atomic<bool> stopping_;
    std::unique_ptr<network::TcpClient> tcp_client_;
    mutable std::mutex client_mutex_;
    std::condition_variable stop_cv_;
};

}
