#include "tether/transfer/file_sender.hpp"
#include "tether/core/logger.hpp"
#include "tether/core/utils.hpp"
#include <stdexcept>

namespace tether::transfer {

using core::Result;
using core::TransferError;
using core::utils::StringUtils;

FileSender::FileSender(std::shared_ptr<network::MessageChannel> channel,
                       const std::string& session_id,
                       std::unique_ptr<ChunkSource> source,
                       SenderOptions options)
    : channel_(std::move(channel))
    , source_(std::move(source))
    , options_(std::move(options))
    , session_(session_id, options_.client_id.value_or(""), SessionRole::SENDER)
    , flow_(options_.send_window)
    , next_index_(0)
    , source_exhausted_(false)
    , pumping_(false)
    , finished_(false)
{
    if (options_.chunk_size == 0) {
        options_.chunk_size = 65536;
    } else if (options_.chunk_size > network::MAX_CHUNK_SIZE) {
        LOG_WARN("Chunk size {} exceeds the frame limit, using {}",
                 options_.chunk_size, network::MAX_CHUNK_SIZE);
        options_.chunk_size = network::MAX_CHUNK_SIZE;
    }
}

FileSender::~FileSender() {
    if (source_) {
        source_->close();
    }
}

void FileSender::start() {
    auto result = session_.begin();
    if (!result) {
        LOG_ERROR("Cannot start sending {}: {}", session_.get_session_id(), result.describe());
        return;
    }
    
    LOG_INFO("Starting upload for {}", session_.get_session_id());
    pump();
}

void FileSender::abort(Result reason) {
    fail(std::move(reason), false);
}

void FileSender::pump() {
    if (pumping_) {
        return;
    }
    
    pumping_ = true;
    while (!finished_ && !source_exhausted_ && flow_.try_acquire()) {
        send_next_chunk();
    }
    pumping_ = false;
    
    finish_if_drained();
}

void FileSender::send_next_chunk() {
    // The credit taken by pump() is returned here unless send_envelope
    // accepted the chunk, in which case the write completion returns it
    std::vector<std::uint8_t> buffer;
    Result result;
    try {
        result = source_->read(buffer, options_.chunk_size);
    } catch (const std::exception& e) {
        result = Result(TransferError::SOURCE_READ_ERROR, e.what());
    }
    
    if (!result) {
        flow_.release();
        fail(std::move(result), true);
        return;
    }
    
    if (buffer.empty()) {
        flow_.release();
        source_exhausted_ = true;
        return;
    }
    
    if (source_->at_end()) {
        source_exhausted_ = true;
    }
    
    std::uint64_t index = next_index_;
    std::size_t byte_count = buffer.size();
    
    try {
        auto chunk = network::ChunkMessage::from_bytes(session_.get_session_id(), index, buffer);
        chunk.client_id = options_.client_id;
        
        auto self = shared_from_this();
        channel_->send_envelope(chunk, [self, index, byte_count](const boost::system::error_code& error) {
            self->on_chunk_flushed(index, byte_count, error);
        });
    } catch (const std::exception& e) {
        flow_.release();
        fail(Result(TransferError::MALFORMED_ENVELOPE,
                    "Cannot send chunk " + std::to_string(index) + ": " + e.what()), true);
        return;
    }
    
    ++next_index_;
}

void FileSender::on_chunk_flushed(std::uint64_t sequence_index, std::size_t byte_count,
                                  const boost::system::error_code& error) {
    flow_.release();
    
    if (finished_) {
        return;
    }
    
    if (error) {
        fail(Result(TransferError::CONNECTION_LOST, "Write failed: " + error.message()), false);
        return;
    }
    
    auto result = session_.record_chunk(sequence_index, byte_count);
    if (!result) {
        fail(std::move(result), true);
        return;
    }
    
    std::uint64_t sent = session_.get_chunks();
    if (options_.progress_interval > 0 && sent % options_.progress_interval == 0) {
        LOG_INFO("Sent {} chunks ({}) for {}", sent,
                 StringUtils::format_bytes(session_.get_bytes()), session_.get_session_id());
    }
    
    pump();
}

void FileSender::finish_if_drained() {
    if (finished_ || pumping_ || !source_exhausted_ || !flow_.is_idle()) {
        return;
    }
    
    finished_ = true;
    source_->close();
    
    std::uint64_t chunks = session_.get_chunks();
    std::uint64_t bytes = session_.get_bytes();
    session_.complete(chunks, bytes);
    
    network::CompleteMessage complete{session_.get_session_id(), chunks, bytes, options_.client_id};
    channel_->send_envelope(complete);
    
    LOG_INFO("Upload {} complete: {} chunks, {} MB in {}",
             session_.get_session_id(), chunks, StringUtils::format_megabytes(bytes),
             StringUtils::format_duration(session_.get_elapsed()));
    
    notify_finished();
}

void FileSender::fail(Result reason, bool notify_peer) {
    if (finished_) {
        return;
    }
    
    finished_ = true;
    source_->close();
    session_.fail(reason);
    
    if (notify_peer && channel_->is_open()) {
        network::ErrorMessage error{session_.get_session_id(), reason.message, options_.client_id};
        channel_->send_envelope(error);
    }
    
    LOG_WARN("Upload {} failed: {}", session_.get_session_id(), reason.describe());
    notify_finished();
}

void FileSender::notify_finished() {
    if (finished_handler_) {
        auto handler = std::move(finished_handler_);
        finished_handler_ = nullptr;
        handler(session_);
    }
}

}
