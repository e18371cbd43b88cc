#pragma once

#include "tether/core/config.hpp"
#include "tether/network/message_channel.hpp"
#include "tether/transfer/file_sender.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tether::client {

using ChannelPtr = std::shared_ptr<network::MessageChannel>;

struct AgentOptions {
    std::string client_id;
    std::filesystem::path file_path;
    std::size_t chunk_size = 65536;
    std::uint32_t send_window = 1;
    std::uint64_t progress_interval = 100;
    
    // A missing client.id gets a random "client-xxxxxxxxx" id
    static AgentOptions from_config(const core::Config& config);
    static std::string generate_client_id();
};

// Client-side protocol handling: registers, answers download requests by
// streaming the configured file, rejects overlapping requests. Envelope and
// disconnect callbacks must arrive on one thread.
class FetchAgent {
public:
    using SourceFactory = std::function<std::unique_ptr<transfer::ChunkSource>(const std::filesystem::path&)>;
    
    explicit FetchAgent(AgentOptions options, SourceFactory source_factory = nullptr);
    
    FetchAgent(const FetchAgent&) = delete;
    FetchAgent& operator=(const FetchAgent&) = delete;
    
    // Sends REGISTER on a freshly connected channel
    void on_connected(const ChannelPtr& channel);
    void handle_envelope(const ChannelPtr& channel, const network::Envelope& envelope);
    void handle_disconnect();
    
    bool is_registered() const { return registered_; }
    bool has_active_upload() const { return active_sender_ != nullptr; }
    std::shared_ptr<transfer::FileSender> get_active_sender() const { return active_sender_; }
    std::optional<transfer::SessionStats> get_last_upload() const { return last_upload_; }
    const AgentOptions& get_options() const { return options_; }

private:
    void on_download_request(const ChannelPtr& channel, const network::DownloadRequestMessage& request);
    void send_error(const ChannelPtr& channel, const std::string& session_id, const std::string& message);
    
    AgentOptions options_;
    SourceFactory source_factory_;
    
    std::atomic<bool> registered_;
    std::shared_ptr<transfer::FileSender> active_sender_;
    std::optional<transfer::SessionStats> last_upload_;
};

}
