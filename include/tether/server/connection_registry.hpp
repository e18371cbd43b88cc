#pragma once

#include "tether/core/result.hpp"
#include "tether/network/message_channel.hpp"
#include "tether/transfer/transfer_session.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tether::server {

using ChannelPtr = std::shared_ptr<network::MessageChannel>;
using SessionPtr = std::shared_ptr<transfer::TransferSession>;

struct ClientInfo {
    std::string client_id;
    std::string remote_endpoint;
    std::chrono::system_clock::time_point connected_at;
    bool has_active_download;
    std::optional<std::string> active_session_id;
};

// Maps registered client ids to their live channel and at most one
// active receiver session. All members are thread-safe.
class ConnectionRegistry {
public:
    ConnectionRegistry() = default;
    
    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;
    
    // Last registration wins. Acknowledges with REGISTERED on the channel
    // and returns the sessions of any entries it displaced, already failed.
    std::vector<SessionPtr> register_client(const ChannelPtr& channel, const std::string& client_id);
    
    // Removes the entry owned by channel and fails its active session
    SessionPtr unregister(const ChannelPtr& channel);
    
    ChannelPtr lookup(const std::string& client_id) const;
    std::optional<std::string> find_client_id(const ChannelPtr& channel) const;
    
    // Attaches session when the client is present and idle
    core::Result begin_session(const std::string& client_id, const SessionPtr& session,
                               ChannelPtr& channel_out);
    SessionPtr active_session(const std::string& client_id) const;
    bool release_session(const std::string& client_id, const std::string& session_id);
    
    std::vector<SessionPtr> expire_idle_sessions(std::chrono::milliseconds timeout);
    
    std::vector<ClientInfo> list_clients() const;
    std::size_t size() const;

private:
    struct Entry {
        ChannelPtr channel;
        std::chrono::system_clock::time_point connected_at;
        SessionPtr session;
    };
    
    SessionPtr detach_locked(Entry& entry, core::TransferError reason, const std::string& message);
    
    std::unordered_map<std::string, Entry> clients_;
    std::unordered_map<network::MessageChannel*, std::string> channel_index_;
    mutable std::mutex mutex_;
};

}
