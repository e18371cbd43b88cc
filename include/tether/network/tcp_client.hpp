#pragma once

#include "tether/network/connection.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace tether::network {

enum class ClientState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    FAILED
};

// Dials out and drives the resulting connection on its own io_context.
// connect() and run() are called from the same thread.
class TcpClient {
public:
    TcpClient();
    ~TcpClient();
    
    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;
    
    bool connect(const std::string& host, std::uint16_t port,
                 std::chrono::milliseconds timeout = std::chrono::seconds(10));
    
    // Blocks until the connection closes
    void run();
    
    // Safe from any thread
    void disconnect();
    
    ClientState get_state() const;
    bool is_connected() const { return get_state() == ClientState::CONNECTED; }
    std::shared_ptr<Connection> get_connection() const;
    
    void set_envelope_handler(Connection::EnvelopeHandler handler) { envelope_handler_ = std::move(handler); }
    void set_disconnect_handler(Connection::DisconnectHandler handler) { disconnect_handler_ = std::move(handler); }

private:
    void set_state(ClientState new_state);
    
    boost::asio::io_context io_context_;
    ClientState state_;
    std::shared_ptr<Connection> connection_;
    mutable std::mutex state_mutex_;
    
    Connection::EnvelopeHandler envelope_handler_;
    Connection::DisconnectHandler disconnect_handler_;
};

}
