#pragma once

#include "tether/network/connection.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace tether::network {

class TcpServer {
public:
    using ConnectionHandler = std::function<void(std::shared_ptr<Connection>)>;
    
    // Port 0 binds an ephemeral port; see get_port()
    TcpServer(const std::string& bind_address, std::uint16_t port);
    ~TcpServer();
    
    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;
    
    bool start();
    void stop();
    
    bool is_running() const { return running_; }
    std::uint16_t get_port() const { return port_; }
    std::size_t get_connection_count() const;
    
    void set_connection_handler(ConnectionHandler handler) { connection_handler_ = std::move(handler); }
    void set_envelope_handler(Connection::EnvelopeHandler handler) { envelope_handler_ = std::move(handler); }
    void set_disconnect_handler(Connection::DisconnectHandler handler) { disconnect_handler_ = std::move(handler); }

private:
    void do_accept();
    void handle_new_connection(std::shared_ptr<Connection> connection);
    void handle_connection_closed(std::shared_ptr<Connection> connection);
    
    std::string bind_address_;
    std::uint16_t port_;
    std::atomic<bool> running_;
    
    boost::asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::thread server_thread_;
    
    std::unordered_set<std::shared_ptr<Connection>> connections_;
    mutable std::mutex connections_mutex_;
    
    ConnectionHandler connection_handler_;
    Connection::EnvelopeHandler envelope_handler_;
    Connection::DisconnectHandler disconnect_handler_;
};

}
