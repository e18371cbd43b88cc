#include "tether/transfer/chunk_sink.hpp"
#include "tether/core/logger.hpp"
#include "tether/core/utils.hpp"

namespace tether::transfer {

using core::Result;
using core::TransferError;

FileChunkSink::FileChunkSink(std::filesystem::path path)
    : path_(std::move(path))
    , bytes_written_(0) {
}

FileChunkSink::~FileChunkSink() {
    if (file_.is_open()) {
        file_.close();
    }
}

Result FileChunkSink::open() {
    if (path_.has_parent_path() &&
        !core::utils::FileUtils::create_directories(path_.parent_path())) {
        return Result(TransferError::SINK_WRITE_ERROR,
                      "Cannot create directory " + path_.parent_path().string());
    }
    
    file_.open(path_, std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        return Result(TransferError::SINK_WRITE_ERROR, "Cannot open " + path_.string() + " for writing");
    }
    
    bytes_written_ = 0;
    LOG_DEBUG("Opened sink {}", path_.string());
    return Result();
}

Result FileChunkSink::write(std::span<const std::uint8_t> bytes) {
    if (!file_.is_open()) {
        return Result(TransferError::SINK_WRITE_ERROR, "Sink " + path_.string() + " is not open");
    }
    
    file_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file_) {
        return Result(TransferError::SINK_WRITE_ERROR, "Failed to write " + path_.string());
    }
    
    bytes_written_ += bytes.size();
    return Result();
}

Result FileChunkSink::finish() {
    if (!file_.is_open()) {
        return Result(TransferError::SINK_WRITE_ERROR, "Sink " + path_.string() + " is not open");
    }
    
    file_.flush();
    bool flushed = static_cast<bool>(file_);
    file_.close();
    
    if (!flushed || file_.fail()) {
        return Result(TransferError::SINK_WRITE_ERROR, "Failed to flush " + path_.string());
    }
    
    return Result();
}

void FileChunkSink::discard(bool remove_output) {
    if (file_.is_open()) {
        file_.close();
    }
    
    if (remove_output) {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec) {
            LOG_WARN("Failed to remove partial file {}: {}", path_.string(), ec.message());
        } else {
            LOG_DEBUG("Removed partial file {}", path_.string());
        }
    }
}

}
