#include "tether/client/fetch_agent.hpp"
#include "tether/core/logger.hpp"
#include "tether/core/utils.hpp"
#include "tether/crypto/random.hpp"

namespace tether::client {

using core::Result;
using core::TransferError;

AgentOptions AgentOptions::from_config(const core::Config& config) {
    AgentOptions options;
    options.client_id = config.get_string("client.id");
    if (options.client_id.empty()) {
        options.client_id = generate_client_id();
    }
    options.file_path = core::utils::FileUtils::expand_home(
        config.get_string("client.file_path", "~/file_to_download.txt"));
    options.chunk_size = config.get_uint64("transfer.chunk_size", 65536);
    if (options.chunk_size == 0) {
        options.chunk_size = 65536;
    } else if (options.chunk_size > network::MAX_CHUNK_SIZE) {
        LOG_WARN("transfer.chunk_size {} does not fit in one frame, using {}",
                 options.chunk_size, network::MAX_CHUNK_SIZE);
        options.chunk_size = network::MAX_CHUNK_SIZE;
    }
    options.send_window = static_cast<std::uint32_t>(config.get_uint64("transfer.send_window", 1));
    options.progress_interval = config.get_uint64("transfer.progress_interval", 100);
    return options;
}

std::string AgentOptions::generate_client_id() {
    return "client-" + crypto::SecureRandom::generate_base36(9);
}

FetchAgent::FetchAgent(AgentOptions options, SourceFactory source_factory)
    : options_(std::move(options))
    , source_factory_(std::move(source_factory))
    , registered_(false) {
    if (!source_factory_) {
        source_factory_ = [](const std::filesystem::path& path) {
            return std::make_unique<transfer::FileChunkSource>(path);
        };
    }
}

void FetchAgent::on_connected(const ChannelPtr& channel) {
    registered_ = false;
    LOG_INFO("Registering as {}", options_.client_id);
    channel->send_envelope(network::RegisterMessage{options_.client_id});
}

void FetchAgent::handle_envelope(const ChannelPtr& channel, const network::Envelope& envelope) {
    if (auto* message = std::get_if<network::RegisteredMessage>(&envelope)) {
        registered_ = true;
        LOG_INFO("Registered with server as {}", message->client_id);
    } else if (auto* message = std::get_if<network::DownloadRequestMessage>(&envelope)) {
        on_download_request(channel, *message);
    } else if (auto* message = std::get_if<network::ErrorMessage>(&envelope)) {
        LOG_ERROR("Server error: {}", message->message);
    } else if (auto* message = std::get_if<network::MalformedMessage>(&envelope)) {
        LOG_WARN("Discarding malformed envelope from server: {}", message->reason);
    } else {
        LOG_DEBUG("Ignoring {} from server", network::envelope_type_name(envelope));
    }
}

void FetchAgent::handle_disconnect() {
    registered_ = false;
    
    if (active_sender_) {
        auto sender = std::move(active_sender_);
        active_sender_.reset();
        sender->abort(Result(TransferError::CONNECTION_LOST, "Disconnected from server"));
        last_upload_ = sender->get_session().snapshot();
    }
}

void FetchAgent::on_download_request(const ChannelPtr& channel,
                                     const network::DownloadRequestMessage& request) {
    LOG_INFO("Download requested: {}", request.session_id);
    
    if (active_sender_) {
        LOG_WARN("Rejecting {}: {} still uploading", request.session_id,
                 active_sender_->get_session_id());
        send_error(channel, request.session_id,
                   "Session " + active_sender_->get_session_id() + " already in progress");
        return;
    }
    
    auto source = source_factory_(options_.file_path);
    auto result = source->open();
    if (!result) {
        LOG_ERROR("Cannot serve {} from {}: {}", request.session_id,
                  options_.file_path.string(), result.describe());
        send_error(channel, request.session_id, result.message);
        return;
    }
    
    transfer::SenderOptions sender_options;
    sender_options.chunk_size = options_.chunk_size;
    sender_options.send_window = options_.send_window;
    sender_options.progress_interval = options_.progress_interval;
    sender_options.client_id = options_.client_id;
    
    auto sender = std::make_shared<transfer::FileSender>(
        channel, request.session_id, std::move(source), sender_options);
    
    sender->set_finished_handler([this](const transfer::TransferSession& session) {
        last_upload_ = session.snapshot();
        if (active_sender_ && active_sender_->get_session_id() == session.get_session_id()) {
            active_sender_.reset();
        }
    });
    
    active_sender_ = sender;
    sender->start();
}

void FetchAgent::send_error(const ChannelPtr& channel, const std::string& session_id,
                            const std::string& message) {
    channel->send_envelope(network::ErrorMessage{session_id, message, options_.client_id});
}

}
