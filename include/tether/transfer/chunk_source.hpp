#pragma once

#include "tether/core/result.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <vector>

namespace tether::transfer {

// Sequential byte source read in bounded pieces
class ChunkSource {
public:
    virtual ~ChunkSource() = default;
    
    virtual core::Result open() = 0;
    
    // Replaces buffer with up to max_bytes; an empty buffer means end of source
    virtual core::Result read(std::vector<std::uint8_t>& buffer, std::size_t max_bytes) = 0;
    virtual bool at_end() const = 0;
    virtual void close() = 0;
};

class FileChunkSource : public ChunkSource {
public:
    explicit FileChunkSource(std::filesystem::path path);
    ~FileChunkSource() override;
    
    core::Result open() override;
    core::Result read(std::vector<std::uint8_t>& buffer, std::size_t max_bytes) override;
    bool at_end() const override { return at_end_; }
    void close() override;
    
    const std::filesystem::path& get_path() const { return path_; }
    std::uint64_t get_size() const { return size_; }
    
private:
    std::filesystem::path path_;
    std::ifstream file_;
    std::uint64_t size_;
    bool at_end_;
};

}
