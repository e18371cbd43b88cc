#pragma once

#include "tether/network/message_channel.hpp"
#include "tether/network/protocol.hpp"
#include <utility> // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <queue>
#include <string>

namespace tether::network {

using boost::asio::ip::tcp;

enum class ConnectionState {
    DISCONNECTED,
    CONNECTED,
    CLOSING
};

class Connection : public MessageChannel, public std::enable_shared_from_this<Connection> {
public:
    using EnvelopeHandler = std::function<void(std::shared_ptr<Connection>, Envelope)>;
    using DisconnectHandler = std::function<void(std::shared_ptr<Connection>)>;
    
    Connection(boost::asio::io_context& io_context, tcp::socket socket);
    ~Connection() override;
    
    void start();
    void close() override;
    
    // Safe from any thread; the write itself runs on the io_context
    void send_envelope(const Envelope& envelope, SendCallback on_flushed = nullptr) override;
    
    bool is_open() const override { return state_ == ConnectionState::CONNECTED; }
    const std::string& get_remote_endpoint() const override { return remote_endpoint_; }
    
    void set_envelope_handler(EnvelopeHandler handler) { envelope_handler_ = std::move(handler); }
    void set_disconnect_handler(DisconnectHandler handler) { disconnect_handler_ = std::move(handler); }
    
    ConnectionState get_state() const { return state_; }

private:
    struct PendingWrite {
        std::vector<std::uint8_t> frame;
        SendCallback on_flushed;
    };
    
    void do_read_header();
    void do_read_payload(std::uint32_t payload_size);
    void enqueue_write(PendingWrite write);
    void do_write();
    void handle_payload();
    void handle_error(const boost::system::error_code& error);
    void fail_pending_writes(const boost::system::error_code& error);
    
    boost::asio::io_context& io_context_;
    tcp::socket socket_;
    std::atomic<ConnectionState> state_;
    std::string remote_endpoint_;
    
    EnvelopeHandler envelope_handler_;
    DisconnectHandler disconnect_handler_;
    
    std::array<std::uint8_t, FRAME_HEADER_SIZE> read_header_buffer_;
    std::vector<std::uint8_t> read_payload_buffer_;
    
    std::queue<PendingWrite> write_queue_;
    bool write_in_progress_;
};

}
