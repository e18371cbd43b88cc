#include "tether/server/download_orchestrator.hpp"
#include "tether/core/logger.hpp"
#include "tether/core/utils.hpp"
#include "tether/crypto/random.hpp"

namespace tether::server {

using core::Result;
using core::TransferError;

DownloadOrchestrator::DownloadOrchestrator(ConnectionRegistry& registry)
    : registry_(registry) {
}

std::string DownloadOrchestrator::generate_session_id() {
    auto millis = core::utils::TimeUtils::epoch_millis(core::utils::TimeUtils::now());
    return "download_" + std::to_string(millis) + "_" + crypto::SecureRandom::generate_hex(4);
}

DownloadTicket DownloadOrchestrator::request_download(const std::string& client_id) {
    DownloadTicket ticket;
    ticket.client_id = client_id;
    
    auto session_id = generate_session_id();
    auto session = std::make_shared<transfer::TransferSession>(
        session_id, client_id, transfer::SessionRole::RECEIVER);
    
    ChannelPtr channel;
    ticket.result = registry_.begin_session(client_id, session, channel);
    if (!ticket.result) {
        LOG_WARN("Download request for {} rejected: {}", client_id, ticket.result.describe());
        ticket.status = "rejected";
        return ticket;
    }
    
    ticket.session_id = session_id;
    ticket.session = session;
    ticket.status = "initiated";
    
    LOG_INFO("Requesting file from {} (session {})", client_id, session_id);
    
    auto& registry = registry_;
    channel->send_envelope(network::DownloadRequestMessage{session_id},
        [&registry, session, client_id](const boost::system::error_code& error) {
            if (!error) {
                return;
            }
            
            LOG_ERROR("Failed to deliver download request {} to {}: {}",
                      session->get_session_id(), client_id, error.message());
            session->fail(Result(TransferError::CONNECTION_LOST,
                                 "Download request not delivered: " + error.message()));
            registry.release_session(client_id, session->get_session_id());
        });
    
    return ticket;
}

}
