#pragma once

#include "tether/network/message_channel.hpp"
#include "tether/network/protocol.hpp"
#include <boost/asio/error.hpp>
#include <algorithm>
#include <deque>
#include <functional>
#include <vector>

namespace tether::testing {

// In-memory MessageChannel. Sends are recorded; write completions either
// fire immediately or wait for flush_next() when deferred.
class FakeChannel : public network::MessageChannel {
public:
    explicit FakeChannel(std::string endpoint = "127.0.0.1:40000")
        : endpoint_(std::move(endpoint)) {}
    
    void send_envelope(const network::Envelope& envelope, SendCallback on_flushed = nullptr) override {
        sent.push_back(envelope);
        
        if (!open_) {
            if (on_flushed) on_flushed(boost::asio::error::not_connected);
            return;
        }
        
        if (deferred) {
            pending_.push_back(std::move(on_flushed));
            max_pending = std::max(max_pending, pending_.size());
            return;
        }
        
        if (on_flushed) {
            on_flushed(fail_writes ? boost::system::error_code(boost::asio::error::broken_pipe)
                                   : boost::system::error_code());
        }
    }
    
    void close() override { open_ = false; }
    bool is_open() const override { return open_; }
    const std::string& get_remote_endpoint() const override { return endpoint_; }
    
    // Completes the oldest deferred write; false when none is pending
    bool flush_next(const boost::system::error_code& error = {}) {
        if (pending_.empty()) return false;
        auto callback = std::move(pending_.front());
        pending_.pop_front();
        if (callback) callback(error);
        return true;
    }
    
    void flush_all() {
        while (flush_next()) {}
    }
    
    std::size_t pending() const { return pending_.size(); }
    
    template<typename T>
    std::vector<T> sent_of() const {
        std::vector<T> result;
        for (const auto& envelope : sent) {
            if (auto* message = std::get_if<T>(&envelope)) {
                result.push_back(*message);
            }
        }
        return result;
    }
    
    std::vector<network::Envelope> sent;
    bool deferred = false;
    bool fail_writes = false;
    std::size_t max_pending = 0;

private:
    std::string endpoint_;
    bool open_ = true;
    std::deque<SendCallback> pending_;
};

// FakeChannel that frames each envelope first, so oversized envelopes throw
// from send_envelope the way they do on a socket connection
class FramingChannel : public FakeChannel {
public:
    void send_envelope(const network::Envelope& envelope, SendCallback on_flushed = nullptr) override {
        auto frame = network::build_frame(network::encode_envelope(envelope));
        largest_frame = std::max(largest_frame, frame.size());
        FakeChannel::send_envelope(envelope, std::move(on_flushed));
    }
    
    std::size_t largest_frame = 0;
};

// Delivers every envelope straight to a receiver callback, then reports
// the write as flushed. Two of these wired together make an in-memory link.
class LoopbackChannel : public network::MessageChannel {
public:
    using Receiver = std::function<void(const network::Envelope&)>;
    
    explicit LoopbackChannel(std::string endpoint) : endpoint_(std::move(endpoint)) {}
    
    void set_receiver(Receiver receiver) { receiver_ = std::move(receiver); }
    
    void send_envelope(const network::Envelope& envelope, SendCallback on_flushed = nullptr) override {
        if (!open_) {
            if (on_flushed) on_flushed(boost::asio::error::not_connected);
            return;
        }
        
        delivered++;
        if (receiver_) receiver_(envelope);
        if (on_flushed) on_flushed({});
    }
    
    void close() override { open_ = false; }
    bool is_open() const override { return open_; }
    const std::string& get_remote_endpoint() const override { return endpoint_; }
    
    std::size_t delivered = 0;

private:
    std::string endpoint_;
    bool open_ = true;
    Receiver receiver_;
};

}
