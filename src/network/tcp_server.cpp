#include "tether/network/tcp_server.hpp"
#include "tether/core/logger.hpp"

namespace tether::network {

TcpServer::TcpServer(const std::string& bind_address, std::uint16_t port)
    : bind_address_(bind_address)
    , port_(port)
    , running_(false)
    , io_context_()
    , acceptor_(io_context_) {
}

TcpServer::~TcpServer() {
    stop();
}

bool TcpServer::start() {
    if (running_) {
        LOG_WARN("TCP server already running");
        return false;
    }
    
    try {
        tcp::endpoint endpoint(boost::asio::ip::make_address(bind_address_), port_);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();
        running_ = true;
        
        do_accept();
        
        server_thread_ = std::thread([this]() {
            LOG_INFO("TCP server started on {}:{}", bind_address_, port_);
            
            while (running_) {
                try {
                    io_context_.run();
                    break;
                } catch (const std::exception& e) {
                    LOG_ERROR("IO context error: {}", e.what());
                    if (!running_) break;
                    
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    io_context_.restart();
                }
            }
            
            LOG_INFO("TCP server stopped");
        });
        
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start TCP server on {}:{}: {}", bind_address_, port_, e.what());
        boost::system::error_code ec;
        acceptor_.close(ec);
        running_ = false;
        return false;
    }
}

void TcpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    
    LOG_INFO("Stopping TCP server on port {}", port_);
    
    // Closing on the io thread lets disconnect handlers run before it exits
    boost::asio::post(io_context_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        
        std::vector<std::shared_ptr<Connection>> open;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            open.assign(connections_.begin(), connections_.end());
        }
        for (auto& connection : open) {
            connection->close();
        }
    });
    
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.clear();
}

std::size_t TcpServer::get_connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void TcpServer::do_accept() {
    if (!running_) {
        return;
    }
    
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec && running_) {
                auto connection = std::make_shared<Connection>(io_context_, std::move(socket));
                handle_new_connection(connection);
                
                do_accept();
            } else if (ec != boost::asio::error::operation_aborted) {
                LOG_ERROR("Accept error: {}", ec.message());
                
                if (running_) {
                    do_accept();
                }
            }
        });
}

void TcpServer::handle_new_connection(std::shared_ptr<Connection> connection) {
    LOG_INFO("New connection accepted from {}", connection->get_remote_endpoint());
    
    connection->set_envelope_handler(
        [this](std::shared_ptr<Connection> conn, Envelope envelope) {
            if (envelope_handler_) {
                envelope_handler_(std::move(conn), std::move(envelope));
            }
        });
    
    connection->set_disconnect_handler(
        [this](std::shared_ptr<Connection> conn) {
            handle_connection_closed(conn);
        });
    
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.insert(connection);
    }
    
    if (connection_handler_) {
        connection_handler_(connection);
    }
    
    connection->start();
}

void TcpServer::handle_connection_closed(std::shared_ptr<Connection> connection) {
    LOG_INFO("Connection closed: {}", connection->get_remote_endpoint());
    
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.erase(connection);
    }
    
    if (disconnect_handler_) {
        disconnect_handler_(connection);
    }
}

}
