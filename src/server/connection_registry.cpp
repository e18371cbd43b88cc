#include "tether/server/connection_registry.hpp"
#include "tether/core/logger.hpp"
#include <algorithm>

namespace tether::server {

using core::Result;
using core::TransferError;

std::vector<SessionPtr> ConnectionRegistry::register_client(const ChannelPtr& channel,
                                                            const std::string& client_id) {
    std::vector<SessionPtr> displaced;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        
        // A channel re-registering under a new id gives up its old entry
        auto previous = channel_index_.find(channel.get());
        if (previous != channel_index_.end() && previous->second != client_id) {
            auto old = clients_.find(previous->second);
            if (old != clients_.end()) {
                LOG_INFO("Connection {} re-registered as {} (was {})",
                         channel->get_remote_endpoint(), client_id, previous->second);
                if (auto session = detach_locked(old->second, TransferError::CONNECTION_LOST,
                                                 "Client re-registered under a new id")) {
                    displaced.push_back(session);
                }
                clients_.erase(old);
            }
            channel_index_.erase(previous);
        }
        
        auto existing = clients_.find(client_id);
        if (existing != clients_.end()) {
            if (existing->second.channel != channel) {
                LOG_WARN("Client {} registered again from {}, replacing previous connection",
                         client_id, channel->get_remote_endpoint());
                if (auto session = detach_locked(existing->second, TransferError::CONNECTION_LOST,
                                                 "Client registered from another connection")) {
                    displaced.push_back(session);
                }
                channel_index_.erase(existing->second.channel.get());
                existing->second.channel = channel;
            }
            existing->second.connected_at = std::chrono::system_clock::now();
        } else {
            clients_.emplace(client_id, Entry{channel, std::chrono::system_clock::now(), nullptr});
        }
        
        channel_index_[channel.get()] = client_id;
    }
    
    LOG_INFO("Client {} registered from {}", client_id, channel->get_remote_endpoint());
    channel->send_envelope(network::RegisteredMessage{client_id});
    
    return displaced;
}

SessionPtr ConnectionRegistry::unregister(const ChannelPtr& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto index = channel_index_.find(channel.get());
    if (index == channel_index_.end()) {
        return nullptr;
    }
    
    std::string client_id = index->second;
    channel_index_.erase(index);
    
    auto it = clients_.find(client_id);
    if (it == clients_.end() || it->second.channel != channel) {
        return nullptr;
    }
    
    auto session = detach_locked(it->second, TransferError::CONNECTION_LOST, "Client disconnected");
    clients_.erase(it);
    
    LOG_INFO("Client {} unregistered", client_id);
    return session;
}

ChannelPtr ConnectionRegistry::lookup(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(client_id);
    return it != clients_.end() ? it->second.channel : nullptr;
}

std::optional<std::string> ConnectionRegistry::find_client_id(const ChannelPtr& channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channel_index_.find(channel.get());
    if (it == channel_index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Result ConnectionRegistry::begin_session(const std::string& client_id, const SessionPtr& session,
                                         ChannelPtr& channel_out) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = clients_.find(client_id);
    if (it == clients_.end()) {
        return Result(TransferError::CLIENT_NOT_CONNECTED, "Client not connected");
    }
    
    auto& entry = it->second;
    if (entry.session && entry.session->is_active()) {
        return Result(TransferError::SESSION_ACTIVE,
                      "Session " + entry.session->get_session_id() + " already in progress");
    }
    
    entry.session = session;
    channel_out = entry.channel;
    return Result();
}

SessionPtr ConnectionRegistry::active_session(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(client_id);
    if (it == clients_.end()) {
        return nullptr;
    }
    return it->second.session;
}

bool ConnectionRegistry::release_session(const std::string& client_id, const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(client_id);
    if (it == clients_.end() || !it->second.session ||
        it->second.session->get_session_id() != session_id) {
        return false;
    }
    
    it->second.session.reset();
    return true;
}

std::vector<SessionPtr> ConnectionRegistry::expire_idle_sessions(std::chrono::milliseconds timeout) {
    std::vector<SessionPtr> expired;
    auto now = std::chrono::steady_clock::now();
    
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [client_id, entry] : clients_) {
        if (!entry.session || !entry.session->is_active()) {
            continue;
        }
        
        if (now - entry.session->get_last_activity() < timeout) {
            continue;
        }
        
        LOG_WARN("Session {} for {} idle for over {}ms", entry.session->get_session_id(),
                 client_id, timeout.count());
        expired.push_back(detach_locked(entry, TransferError::SESSION_TIMEOUT, "Session timed out"));
    }
    
    return expired;
}

std::vector<ClientInfo> ConnectionRegistry::list_clients() const {
    std::vector<ClientInfo> clients;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clients.reserve(clients_.size());
        for (const auto& [client_id, entry] : clients_) {
            ClientInfo info;
            info.client_id = client_id;
            info.remote_endpoint = entry.channel->get_remote_endpoint();
            info.connected_at = entry.connected_at;
            info.has_active_download = entry.session && entry.session->is_active();
            if (info.has_active_download) {
                info.active_session_id = entry.session->get_session_id();
            }
            clients.push_back(std::move(info));
        }
    }
    
    std::sort(clients.begin(), clients.end(), [](const ClientInfo& a, const ClientInfo& b) {
        if (a.connected_at != b.connected_at) {
            return a.connected_at < b.connected_at;
        }
        return a.client_id < b.client_id;
    });
    
    return clients;
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

SessionPtr ConnectionRegistry::detach_locked(Entry& entry, TransferError reason, const std::string& message) {
    auto session = std::move(entry.session);
    entry.session.reset();
    
    if (!session || !session->is_active()) {
        return nullptr;
    }
    
    session->fail(Result(reason, message));
    return session;
}

}
