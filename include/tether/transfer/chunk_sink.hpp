#pragma once

#include "tether/core/result.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>

namespace tether::transfer {

// Append-only byte sink for one received file
class ChunkSink {
public:
    virtual ~ChunkSink() = default;
    
    virtual core::Result open() = 0;
    virtual core::Result write(std::span<const std::uint8_t> bytes) = 0;
    
    // Flushes and closes; the output is final afterwards
    virtual core::Result finish() = 0;
    
    // Closes without finishing, optionally removing what was written
    virtual void discard(bool remove_output) = 0;
    
    virtual std::uint64_t get_bytes_written() const = 0;
};

class FileChunkSink : public ChunkSink {
public:
    explicit FileChunkSink(std::filesystem::path path);
    ~FileChunkSink() override;
    
    core::Result open() override;
    core::Result write(std::span<const std::uint8_t> bytes) override;
    core::Result finish() override;
    void discard(bool remove_output) override;
    
    std::uint64_t get_bytes_written() const override { return bytes_written_; }
    const std::filesystem::path& get_path() const { return path_; }
    
private:
    std::filesystem::path path_;
    std::ofstream file_;
    std::uint64_t bytes_written_;
};

}
