#include "tether/server/fetch_service.hpp"
#include "tether/core/logger.hpp"

namespace tether::server {

using core::Result;
using core::TransferError;

ServiceOptions ServiceOptions::from_config(const core::Config& config) {
    ServiceOptions options;
    options.assembler = transfer::AssemblerOptions::from_config(config);
    options.session_timeout = std::chrono::milliseconds(
        config.get_uint64("transfer.session_timeout_ms", 300000));
    return options;
}

FetchService::FetchService(ServiceOptions options, transfer::FileAssembler::SinkFactory sink_factory)
    : options_(std::move(options))
    , registry_()
    , orchestrator_(registry_)
    , assembler_(options_.assembler, std::move(sink_factory)) {
}

void FetchService::handle_envelope(const ChannelPtr& channel, const network::Envelope& envelope) {
    if (auto* message = std::get_if<network::RegisterMessage>(&envelope)) {
        on_register(channel, *message);
    } else if (auto* message = std::get_if<network::ChunkMessage>(&envelope)) {
        on_chunk(channel, *message);
    } else if (auto* message = std::get_if<network::CompleteMessage>(&envelope)) {
        on_complete(channel, *message);
    } else if (auto* message = std::get_if<network::ErrorMessage>(&envelope)) {
        on_error(channel, *message);
    } else if (auto* message = std::get_if<network::MalformedMessage>(&envelope)) {
        LOG_WARN("Discarding malformed envelope from {}: {}",
                 channel->get_remote_endpoint(), message->reason);
    } else {
        LOG_DEBUG("Ignoring {} from {}", network::envelope_type_name(envelope),
                  channel->get_remote_endpoint());
    }
}

void FetchService::handle_disconnect(const ChannelPtr& channel) {
    auto client_id = registry_.find_client_id(channel);
    auto session = registry_.unregister(channel);
    
    if (session) {
        LOG_WARN("Download {} abandoned: client {} disconnected",
                 session->get_session_id(), session->get_client_id());
        assembler_.abandon(session->get_session_id());
    }
    
    if (client_id) {
        LOG_INFO("Client {} disconnected", *client_id);
    }
}

std::vector<ClientInfo> FetchService::list_clients() const {
    return registry_.list_clients();
}

DownloadTicket FetchService::trigger_download(const std::string& client_id) {
    auto ticket = orchestrator_.request_download(client_id);
    if (ticket.accepted()) {
        track(ticket.session);
    }
    return ticket;
}

HealthSnapshot FetchService::health_snapshot() const {
    HealthSnapshot snapshot{0, 0};
    for (const auto& client : registry_.list_clients()) {
        snapshot.connected_clients++;
        if (client.has_active_download) {
            snapshot.active_sessions++;
        }
    }
    return snapshot;
}

std::optional<transfer::SessionStats> FetchService::session_status(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second->snapshot();
}

std::size_t FetchService::expire_idle_sessions() {
    if (options_.session_timeout.count() <= 0) {
        return 0;
    }
    
    auto expired = registry_.expire_idle_sessions(options_.session_timeout);
    for (const auto& session : expired) {
        assembler_.abandon(session->get_session_id());
    }
    return expired.size();
}

void FetchService::on_register(const ChannelPtr& channel, const network::RegisterMessage& message) {
    if (message.client_id.empty()) {
        LOG_WARN("Ignoring registration with empty client id from {}", channel->get_remote_endpoint());
        return;
    }
    
    for (const auto& session : registry_.register_client(channel, message.client_id)) {
        LOG_WARN("Download {} abandoned by re-registration", session->get_session_id());
        assembler_.abandon(session->get_session_id());
    }
}

void FetchService::on_chunk(const ChannelPtr& channel, const network::ChunkMessage& message) {
    auto session = resolve_session(channel, message.session_id, "chunk");
    if (!session) {
        return;
    }
    
    if (!assembler_.on_chunk(session, message) && session->is_terminal()) {
        release(session);
    }
}

void FetchService::on_complete(const ChannelPtr& channel, const network::CompleteMessage& message) {
    auto session = resolve_session(channel, message.session_id, "completion");
    if (!session) {
        return;
    }
    
    assembler_.on_complete(session, message);
    release(session);
}

void FetchService::on_error(const ChannelPtr& channel, const network::ErrorMessage& message) {
    if (!message.session_id) {
        LOG_ERROR("Error from {}: {}", channel->get_remote_endpoint(), message.message);
        return;
    }
    
    auto session = resolve_session(channel, *message.session_id, "error");
    if (!session) {
        LOG_WARN("Error from {} for unknown session {}: {}", channel->get_remote_endpoint(),
                 *message.session_id, message.message);
        return;
    }
    
    assembler_.on_error(session, message);
    release(session);
}

SessionPtr FetchService::resolve_session(const ChannelPtr& channel, const std::string& session_id,
                                         const char* type) const {
    auto client_id = registry_.find_client_id(channel);
    if (!client_id) {
        LOG_DEBUG("Discarding {} for {} from unregistered connection {}",
                  type, session_id, channel->get_remote_endpoint());
        return nullptr;
    }
    
    auto session = registry_.active_session(*client_id);
    if (!session || session->get_session_id() != session_id) {
        LOG_DEBUG("Discarding {} for stale session {} from {}", type, session_id, *client_id);
        return nullptr;
    }
    
    return session;
}

void FetchService::release(const SessionPtr& session) {
    registry_.release_session(session->get_client_id(), session->get_session_id());
}

void FetchService::track(const SessionPtr& session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    
    sessions_[session->get_session_id()] = session;
    session_order_.push_back(session->get_session_id());
    
    // Oldest finished sessions go first; active ones are stepped over
    auto it = session_order_.begin();
    while (session_order_.size() > options_.history_limit && it != session_order_.end()) {
        auto entry = sessions_.find(*it);
        if (entry != sessions_.end() && entry->second->is_active()) {
            ++it;
            continue;
        }
        if (entry != sessions_.end()) {
            sessions_.erase(entry);
        }
        it = session_order_.erase(it);
    }
}

}
