#pragma once

#include "tether/core/config.hpp"
#include "tether/network/envelope.hpp"
#include "tether/server/connection_registry.hpp"
#include "tether/server/download_orchestrator.hpp"
#include "tether/transfer/file_assembler.hpp"
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tether::server {

struct ServiceOptions {
    transfer::AssemblerOptions assembler;
    std::chrono::milliseconds session_timeout{300000};
    std::size_t history_limit = 1024;
    
    static ServiceOptions from_config(const core::Config& config);
};

struct HealthSnapshot {
    std::size_t connected_clients;
    std::size_t active_sessions;
};

// Server-side protocol dispatch plus the administrative operations
class FetchService {
public:
    explicit FetchService(ServiceOptions options,
                          transfer::FileAssembler::SinkFactory sink_factory = nullptr);
    
    FetchService(const FetchService&) = delete;
    FetchService& operator=(const FetchService&) = delete;
    
    void handle_envelope(const ChannelPtr& channel, const network::Envelope& envelope);
    void handle_disconnect(const ChannelPtr& channel);
    
    std::vector<ClientInfo> list_clients() const;
    DownloadTicket trigger_download(const std::string& client_id);
    HealthSnapshot health_snapshot() const;
    std::optional<transfer::SessionStats> session_status(const std::string& session_id) const;
    
    // Fails sessions idle past the configured timeout; returns how many
    std::size_t expire_idle_sessions();
    
    ConnectionRegistry& get_registry() { return registry_; }
    transfer::FileAssembler& get_assembler() { return assembler_; }
    const ServiceOptions& get_options() const { return options_; }

private:
    void on_register(const ChannelPtr& channel, const network::RegisterMessage& message);
    void on_chunk(const ChannelPtr& channel, const network::ChunkMessage& message);
    void on_complete(const ChannelPtr& channel, const network::CompleteMessage& message);
    void on_error(const ChannelPtr& channel, const network::ErrorMessage& message);
    
    // The channel's active session when it matches session_id, else nullptr
    SessionPtr resolve_session(const ChannelPtr& channel, const std::string& session_id,
                               const char* type) const;
    void release(const SessionPtr& session);
    void track(const SessionPtr& session);
    
    ServiceOptions options_;
    ConnectionRegistry registry_;
    DownloadOrchestrator orchestrator_;
    transfer::FileAssembler assembler_;
    
    std::map<std::string, SessionPtr> sessions_;
    std::deque<std::string> session_order_;
    mutable std::mutex sessions_mutex_;
};

}
