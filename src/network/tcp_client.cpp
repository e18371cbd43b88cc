#include "tether/network/tcp_client.hpp"
#include "tether/core/logger.hpp"
#include <boost/asio/connect.hpp>
#include <optional>

namespace tether::network {

TcpClient::TcpClient()
    : io_context_()
    , state_(ClientState::DISCONNECTED) {
}

TcpClient::~TcpClient() {
    disconnect();
}

bool TcpClient::connect(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) {
    if (get_state() == ClientState::CONNECTED) {
        LOG_WARN("Client already connected");
        return false;
    }
    
    set_state(ClientState::CONNECTING);
    io_context_.restart();
    
    LOG_INFO("Connecting to server at {}:{}", host, port);
    
    tcp::resolver resolver(io_context_);
    boost::system::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        LOG_ERROR("Failed to resolve {}: {}", host, ec.message());
        set_state(ClientState::FAILED);
        return false;
    }
    
    tcp::socket socket(io_context_);
    std::optional<boost::system::error_code> result;
    
    boost::asio::async_connect(socket, endpoints,
        [&result](const boost::system::error_code& error, const tcp::endpoint&) {
            result = error;
        });
    
    io_context_.run_for(timeout);
    
    if (!result) {
        LOG_ERROR("Connection to {}:{} timed out", host, port);
        socket.close(ec);
        io_context_.restart();
        io_context_.run();
        set_state(ClientState::FAILED);
        return false;
    }
    
    if (*result) {
        LOG_ERROR("Failed to connect to {}:{}: {}", host, port, result->message());
        set_state(ClientState::FAILED);
        return false;
    }
    
    io_context_.restart();
    
    auto connection = std::make_shared<Connection>(io_context_, std::move(socket));
    
    connection->set_envelope_handler(
        [this](std::shared_ptr<Connection> conn, Envelope envelope) {
            if (envelope_handler_) {
                envelope_handler_(std::move(conn), std::move(envelope));
            }
        });
    
    connection->set_disconnect_handler(
        [this](std::shared_ptr<Connection> conn) {
            set_state(ClientState::DISCONNECTED);
            if (disconnect_handler_) {
                disconnect_handler_(conn);
            }
        });
    
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        connection_ = connection;
    }
    
    set_state(ClientState::CONNECTED);
    LOG_INFO("Connected to server at {}:{}", host, port);
    
    connection->start();
    return true;
}

void TcpClient::run() {
    try {
        io_context_.run();
    } catch (const std::exception& e) {
        LOG_ERROR("Client IO context error: {}", e.what());
        disconnect();
        io_context_.restart();
        io_context_.run();
    }
    
    std::lock_guard<std::mutex> lock(state_mutex_);
    connection_.reset();
}

void TcpClient::disconnect() {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        connection = connection_;
    }
    
    if (connection) {
        connection->close();
    }
}

ClientState TcpClient::get_state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::shared_ptr<Connection> TcpClient::get_connection() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return connection_;
}

void TcpClient::set_state(ClientState new_state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != new_state) {
        LOG_DEBUG("Client state changed: {} -> {}", 
                  static_cast<int>(state_), static_cast<int>(new_state));
        state_ = new_state;
    }
}

}
