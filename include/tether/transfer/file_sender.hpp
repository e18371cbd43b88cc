#pragma once

#include "tether/network/message_channel.hpp"
#include "tether/transfer/chunk_source.hpp"
#include "tether/transfer/flow_control.hpp"
#include "tether/transfer/transfer_session.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tether::transfer {

struct SenderOptions {
    std::size_t chunk_size = 65536;
    std::uint32_t send_window = 1;
    std::uint64_t progress_interval = 100;
    std::optional<std::string> client_id;
};

// Streams one source over a channel as CHUNK envelopes followed by COMPLETE.
// A chunk is read only when the flow controller grants a credit and the
// credit is returned from the channel's write completion. Not thread-safe:
// start(), abort() and the channel callbacks must share one thread.
class FileSender : public std::enable_shared_from_this<FileSender> {
public:
    using FinishedHandler = std::function<void(const TransferSession&)>;
    
    FileSender(std::shared_ptr<network::MessageChannel> channel,
               const std::string& session_id,
               std::unique_ptr<ChunkSource> source,
               SenderOptions options = {});
    ~FileSender();
    
    FileSender(const FileSender&) = delete;
    FileSender& operator=(const FileSender&) = delete;
    
    void start();
    
    // Stops emitting and releases the source without notifying the peer
    void abort(core::Result reason);
    
    bool is_finished() const { return finished_; }
    const TransferSession& get_session() const { return session_; }
    const FlowController& get_flow_controller() const { return flow_; }
    const std::string& get_session_id() const { return session_.get_session_id(); }
    
    void set_finished_handler(FinishedHandler handler) { finished_handler_ = std::move(handler); }

private:
    void pump();
    void send_next_chunk();
    void on_chunk_flushed(std::uint64_t sequence_index, std::size_t byte_count,
                          const boost::system::error_code& error);
    void finish_if_drained();
    void fail(core::Result reason, bool notify_peer);
    void notify_finished();
    
    std::shared_ptr<network::MessageChannel> channel_;
    std::unique_ptr<ChunkSource> source_;
    SenderOptions options_;
    
    TransferSession session_;
    FlowController flow_;
    
    std::uint64_t next_index_;
    bool source_exhausted_;
    bool pumping_;
    bool finished_;
    
    FinishedHandler finished_handler_;
};

}
