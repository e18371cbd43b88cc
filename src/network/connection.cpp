#include "tether/network/connection.hpp"
#include "tether/core/logger.hpp"
#include <boost/asio/write.hpp>
#include <boost/asio/read.hpp>

namespace tether::network {

Connection::Connection(boost::asio::io_context& io_context, tcp::socket socket)
    : io_context_(io_context)
    , socket_(std::move(socket))
    , state_(ConnectionState::CONNECTED)
    , write_in_progress_(false) {
    
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (!ec) {
        remote_endpoint_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    } else {
        remote_endpoint_ = "unknown";
        LOG_WARN("Failed to get remote endpoint: {}", ec.message());
    }
    
    LOG_DEBUG("New connection with {}", remote_endpoint_);
}

Connection::~Connection() {
    LOG_DEBUG("Connection to {} destroyed", remote_endpoint_);
}

void Connection::start() {
    LOG_DEBUG("Starting connection to {}", remote_endpoint_);
    do_read_header();
}

void Connection::close() {
    auto self = shared_from_this();
    auto do_close = [this, self]() {
        auto expected = ConnectionState::CONNECTED;
        if (!state_.compare_exchange_strong(expected, ConnectionState::CLOSING)) {
            return;
        }
        
        LOG_INFO("Closing connection to {}", remote_endpoint_);
        
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        
        state_ = ConnectionState::DISCONNECTED;
        fail_pending_writes(boost::asio::error::operation_aborted);
        
        if (disconnect_handler_) {
            disconnect_handler_(self);
        }
    };
    
    if (io_context_.get_executor().running_in_this_thread()) {
        do_close();
    } else {
        boost::asio::post(io_context_, do_close);
    }
}

void Connection::send_envelope(const Envelope& envelope, SendCallback on_flushed) {
    PendingWrite write{build_frame(encode_envelope(envelope)), std::move(on_flushed)};
    
    LOG_TRACE("Queueing {} ({} bytes) for {}", envelope_type_name(envelope),
              write.frame.size(), remote_endpoint_);
    
    auto self = shared_from_this();
    boost::asio::post(io_context_, [this, self, write = std::move(write)]() mutable {
        enqueue_write(std::move(write));
    });
}

void Connection::enqueue_write(PendingWrite write) {
    if (state_ != ConnectionState::CONNECTED) {
        LOG_WARN("Attempted to send on inactive connection to {}", remote_endpoint_);
        if (write.on_flushed) {
            write.on_flushed(boost::asio::error::not_connected);
        }
        return;
    }
    
    write_queue_.push(std::move(write));
    
    if (!write_in_progress_) {
        do_write();
    }
}

void Connection::do_read_header() {
    if (state_ != ConnectionState::CONNECTED) {
        return;
    }
    
    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_header_buffer_),
        [this, self](boost::system::error_code ec, std::size_t /*length*/) {
            if (ec) {
                handle_error(ec);
                return;
            }
            
            auto header = FrameHeader::deserialize(read_header_buffer_);
            if (!header.is_valid()) {
                LOG_ERROR("Invalid frame header from {} (payload {} bytes)",
                          remote_endpoint_, header.payload_size);
                close();
                return;
            }
            
            do_read_payload(header.payload_size);
        });
}

void Connection::do_read_payload(std::uint32_t payload_size) {
    read_payload_buffer_.resize(payload_size);
    
    if (payload_size == 0) {
        handle_payload();
        do_read_header();
        return;
    }
    
    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_payload_buffer_),
        [this, self](boost::system::error_code ec, std::size_t /*length*/) {
            if (ec) {
                handle_error(ec);
                return;
            }
            
            handle_payload();
            do_read_header();
        });
}

void Connection::do_write() {
    if (write_queue_.empty() || write_in_progress_) {
        return;
    }
    
    write_in_progress_ = true;
    auto& write = write_queue_.front();
    
    auto self = shared_from_this();
    boost::asio::async_write(socket_,
        boost::asio::buffer(write.frame),
        [this, self](boost::system::error_code ec, std::size_t /*length*/) {
            write_in_progress_ = false;
            
            auto completed = std::move(write_queue_.front());
            write_queue_.pop();
            
            if (completed.on_flushed) {
                completed.on_flushed(ec);
            }
            
            if (ec) {
                handle_error(ec);
                return;
            }
            
            do_write();
        });
}

void Connection::handle_payload() {
    std::string_view text(reinterpret_cast<const char*>(read_payload_buffer_.data()),
                          read_payload_buffer_.size());
    auto envelope = decode_envelope(text);
    
    LOG_TRACE("Received {} ({} bytes) from {}", envelope_type_name(envelope),
              read_payload_buffer_.size(), remote_endpoint_);
    
    if (envelope_handler_) {
        try {
            envelope_handler_(shared_from_this(), std::move(envelope));
        } catch (const std::exception& e) {
            LOG_ERROR("Error handling envelope from {}: {}", remote_endpoint_, e.what());
        }
    }
}

void Connection::handle_error(const boost::system::error_code& error) {
    if (error == boost::asio::error::eof) {
        LOG_INFO("Connection to {} closed by peer", remote_endpoint_);
    } else if (error == boost::asio::error::operation_aborted) {
        LOG_DEBUG("Connection operation aborted for {}", remote_endpoint_);
    } else {
        LOG_ERROR("Connection error with {}: {}", remote_endpoint_, error.message());
    }
    
    close();
}

void Connection::fail_pending_writes(const boost::system::error_code& error) {
    // The in-flight frame must outlive its async_write; its handler reports it
    std::queue<PendingWrite> in_flight;
    if (write_in_progress_ && !write_queue_.empty()) {
        in_flight.push(std::move(write_queue_.front()));
        write_queue_.pop();
    }
    
    while (!write_queue_.empty()) {
        auto pending = std::move(write_queue_.front());
        write_queue_.pop();
        if (pending.on_flushed) {
            pending.on_flushed(error);
        }
    }
    
    write_queue_ = std::move(in_flight);
}

}
