#include "tether/transfer/chunk_source.hpp"
#include "tether/core/logger.hpp"

namespace tether::transfer {

using core::Result;
using core::TransferError;

FileChunkSource::FileChunkSource(std::filesystem::path path)
    : path_(std::move(path))
    , size_(0)
    , at_end_(false) {
}

FileChunkSource::~FileChunkSource() {
    close();
}

Result FileChunkSource::open() {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        return Result(TransferError::FILE_NOT_FOUND, "File not found");
    }
    
    size_ = std::filesystem::file_size(path_, ec);
    if (ec) {
        return Result(TransferError::SOURCE_READ_ERROR,
                      "Cannot stat " + path_.string() + ": " + ec.message());
    }
    
    file_.open(path_, std::ios::binary);
    if (!file_.is_open()) {
        return Result(TransferError::SOURCE_READ_ERROR, "Cannot open " + path_.string());
    }
    
    at_end_ = false;
    LOG_DEBUG("Opened {} ({} bytes)", path_.string(), size_);
    return Result();
}

Result FileChunkSource::read(std::vector<std::uint8_t>& buffer, std::size_t max_bytes) {
    buffer.clear();
    
    if (at_end_) {
        return Result();
    }
    
    if (!file_.is_open()) {
        return Result(TransferError::SOURCE_READ_ERROR, "Source " + path_.string() + " is not open");
    }
    
    buffer.resize(max_bytes);
    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(max_bytes));
    
    if (file_.bad()) {
        buffer.clear();
        return Result(TransferError::SOURCE_READ_ERROR, "Failed to read " + path_.string());
    }
    
    buffer.resize(static_cast<std::size_t>(file_.gcount()));
    
    if (file_.eof() || file_.peek() == std::ifstream::traits_type::eof()) {
        at_end_ = true;
    }
    
    if (file_.bad()) {
        return Result(TransferError::SOURCE_READ_ERROR, "Failed to read " + path_.string());
    }
    
    return Result();
}

void FileChunkSource::close() {
    if (file_.is_open()) {
        file_.close();
    }
}

}
