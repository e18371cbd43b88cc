#pragma once

#include "tether/core/config.hpp"
#include "tether/network/envelope.hpp"
#include "tether/transfer/chunk_sink.hpp"
#include "tether/transfer/transfer_session.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tether::transfer {

struct AssemblerOptions {
    std::filesystem::path download_dir = "downloads";
    bool verify_sequence = true;
    bool verify_totals = true;
    bool keep_partial_files = false;
    std::uint64_t progress_interval = 100;
    
    static AssemblerOptions from_config(const core::Config& config);
};

// Writes incoming chunks for receiver sessions to one file per session.
// Callers hand in the session the chunk was validated against; the
// assembler drives that session's state from first chunk to completion.
class FileAssembler {
public:
    using SinkFactory = std::function<std::unique_ptr<ChunkSink>(const std::filesystem::path&)>;
    
    explicit FileAssembler(AssemblerOptions options, SinkFactory sink_factory = nullptr);
    ~FileAssembler();
    
    FileAssembler(const FileAssembler&) = delete;
    FileAssembler& operator=(const FileAssembler&) = delete;
    
    core::Result on_chunk(const std::shared_ptr<TransferSession>& session,
                          const network::ChunkMessage& chunk);
    core::Result on_complete(const std::shared_ptr<TransferSession>& session,
                             const network::CompleteMessage& complete);
    core::Result on_error(const std::shared_ptr<TransferSession>& session,
                          const network::ErrorMessage& error);
    
    // Releases the sink of a session that failed elsewhere
    void abandon(const std::string& session_id);
    
    std::filesystem::path output_path_for(const std::string& client_id,
                                          const std::string& session_id) const;
    
    bool has_open_sink(const std::string& session_id) const;
    std::size_t get_open_sink_count() const;
    const AssemblerOptions& get_options() const { return options_; }

private:
    struct OpenFile {
        std::unique_ptr<ChunkSink> sink;
        std::filesystem::path path;
    };
    
    core::Result open_locked(const std::shared_ptr<TransferSession>& session, OpenFile*& out);
    void discard_locked(const std::string& session_id);
    core::Result fail_locked(const std::shared_ptr<TransferSession>& session, core::Result reason);
    
    AssemblerOptions options_;
    SinkFactory sink_factory_;
    
    std::unordered_map<std::string, OpenFile> open_files_;
    mutable std::mutex mutex_;
};

}
