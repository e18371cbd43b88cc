#include "tether/transfer/file_assembler.hpp"
#include "tether/core/logger.hpp"
#include "tether/core/utils.hpp"

namespace tether::transfer {

using core::Result;
using core::TransferError;
using core::utils::StringUtils;

AssemblerOptions AssemblerOptions::from_config(const core::Config& config) {
    AssemblerOptions options;
    options.download_dir = core::utils::FileUtils::expand_home(
        config.get_string("server.download_dir", "downloads"));
    options.verify_sequence = config.get_bool("transfer.verify_sequence", true);
    options.verify_totals = config.get_bool("transfer.verify_totals", true);
    options.keep_partial_files = config.get_bool("transfer.keep_partial_files", false);
    options.progress_interval = config.get_uint64("transfer.progress_interval", 100);
    return options;
}

FileAssembler::FileAssembler(AssemblerOptions options, SinkFactory sink_factory)
    : options_(std::move(options))
    , sink_factory_(std::move(sink_factory)) {
    if (!sink_factory_) {
        sink_factory_ = [](const std::filesystem::path& path) {
            return std::make_unique<FileChunkSink>(path);
        };
    }
}

FileAssembler::~FileAssembler() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [session_id, file] : open_files_) {
        LOG_DEBUG("Dropping unfinished output for {}", session_id);
        file.sink->discard(!options_.keep_partial_files);
    }
    open_files_.clear();
}

std::filesystem::path FileAssembler::output_path_for(const std::string& client_id,
                                                     const std::string& session_id) const {
    return options_.download_dir / (client_id + "_" + session_id + "_file_to_download.txt");
}

Result FileAssembler::on_chunk(const std::shared_ptr<TransferSession>& session,
                               const network::ChunkMessage& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (session->is_terminal()) {
        LOG_DEBUG("Ignoring chunk {} for finished session {}", chunk.sequence_index, chunk.session_id);
        return Result(TransferError::INVALID_STATE, "Session " + chunk.session_id + " is finished");
    }
    
    OpenFile* file = nullptr;
    auto result = open_locked(session, file);
    if (!result) {
        return fail_locked(session, std::move(result));
    }
    
    auto bytes = chunk.decode_payload();
    if (!bytes) {
        return fail_locked(session, Result(TransferError::MALFORMED_ENVELOPE,
            "Chunk " + std::to_string(chunk.sequence_index) + " payload is not valid base64"));
    }
    
    result = session->record_chunk(chunk.sequence_index, bytes->size(), options_.verify_sequence);
    if (!result) {
        return fail_locked(session, std::move(result));
    }
    
    result = file->sink->write(*bytes);
    if (!result) {
        return fail_locked(session, std::move(result));
    }
    
    std::uint64_t received = session->get_chunks();
    if (options_.progress_interval > 0 && received % options_.progress_interval == 0) {
        LOG_INFO("Received {} chunks ({}) for {}", received,
                 StringUtils::format_bytes(session->get_bytes()), session->get_session_id());
    }
    
    return Result();
}

Result FileAssembler::on_complete(const std::shared_ptr<TransferSession>& session,
                                  const network::CompleteMessage& complete) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (session->is_terminal()) {
        return Result(TransferError::INVALID_STATE, "Session " + complete.session_id + " is finished");
    }
    
    // A zero-chunk transfer has no sink yet; it still produces an empty file
    OpenFile* file = nullptr;
    auto result = open_locked(session, file);
    if (!result) {
        return fail_locked(session, std::move(result));
    }
    
    result = file->sink->finish();
    if (!result) {
        return fail_locked(session, std::move(result));
    }
    
    result = session->complete(complete.total_chunks, complete.total_bytes, options_.verify_totals);
    if (!result) {
        LOG_ERROR("Download {} failed verification: {}", session->get_session_id(), result.describe());
        discard_locked(session->get_session_id());
        return result;
    }
    
    auto stats = session->snapshot();
    LOG_INFO("Download {} complete: {} ({} MB, {} chunks) in {} at {:.2f} MB/s",
             stats.session_id, file->path.string(),
             StringUtils::format_megabytes(stats.bytes), stats.chunks,
             StringUtils::format_duration(stats.elapsed), stats.throughput_mbps);
    
    open_files_.erase(session->get_session_id());
    return Result();
}

Result FileAssembler::on_error(const std::shared_ptr<TransferSession>& session,
                               const network::ErrorMessage& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    return fail_locked(session, Result(TransferError::REMOTE_ERROR, error.message));
}

void FileAssembler::abandon(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    discard_locked(session_id);
}

bool FileAssembler::has_open_sink(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_files_.count(session_id) > 0;
}

std::size_t FileAssembler::get_open_sink_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_files_.size();
}

Result FileAssembler::open_locked(const std::shared_ptr<TransferSession>& session, OpenFile*& out) {
    auto it = open_files_.find(session->get_session_id());
    if (it != open_files_.end()) {
        out = &it->second;
        return Result();
    }
    
    OpenFile file;
    file.path = output_path_for(session->get_client_id(), session->get_session_id());
    file.sink = sink_factory_(file.path);
    
    auto result = file.sink->open();
    if (!result) {
        return result;
    }
    
    result = session->begin();
    if (!result) {
        file.sink->discard(true);
        return result;
    }
    
    LOG_INFO("Receiving {} from {} into {}", session->get_session_id(),
             session->get_client_id(), file.path.string());
    
    auto inserted = open_files_.emplace(session->get_session_id(), std::move(file)).first;
    out = &inserted->second;
    return Result();
}

void FileAssembler::discard_locked(const std::string& session_id) {
    auto it = open_files_.find(session_id);
    if (it == open_files_.end()) {
        return;
    }
    
    it->second.sink->discard(!options_.keep_partial_files);
    open_files_.erase(it);
}

Result FileAssembler::fail_locked(const std::shared_ptr<TransferSession>& session, Result reason) {
    session->fail(reason);
    discard_locked(session->get_session_id());
    LOG_WARN("Download {} from {} failed: {}", session->get_session_id(),
             session->get_client_id(), reason.describe());
    return reason;
}

}
