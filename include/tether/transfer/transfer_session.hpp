#pragma once

#include "tether/core/result.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace tether::transfer {

enum class SessionState {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED
};

enum class SessionRole {
    SENDER,
    RECEIVER
};

const char* to_string(SessionState state);

// Whether the state machine allows from -> to
bool is_valid_transition(SessionState from, SessionState to);

struct SessionStats {
    std::string session_id;
    std::string client_id;
    SessionRole role;
    SessionState state;
    std::uint64_t chunks;
    std::uint64_t bytes;
    std::chrono::system_clock::time_point created_at;
    std::chrono::milliseconds elapsed;
    double throughput_mbps;
    std::optional<core::Result> failure;
};

// One file transfer end to end. Terminal states are final and a session is
// never reused. All members are safe to call from any thread.
class TransferSession {
public:
    TransferSession(const std::string& session_id, const std::string& client_id, SessionRole role);
    
    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;
    
    // PENDING -> IN_PROGRESS; a no-op when already in progress
    core::Result begin();
    
    // Accounts one chunk. With strict ordering, an index other than the
    // running counter fails the session with SEQUENCE_MISMATCH.
    core::Result record_chunk(std::uint64_t sequence_index, std::uint64_t byte_count,
                              bool strict_ordering = true);
    
    // With verify_totals, reported totals must match what was recorded
    core::Result complete(std::uint64_t reported_chunks, std::uint64_t reported_bytes,
                          bool verify_totals = true);
    
    // Returns false when the session was already terminal
    bool fail(core::Result reason);
    
    SessionState get_state() const;
    bool is_terminal() const;
    bool is_active() const { return !is_terminal(); }
    std::optional<core::Result> get_failure() const;
    
    std::uint64_t get_chunks() const;
    std::uint64_t get_bytes() const;
    std::chrono::steady_clock::time_point get_last_activity() const;
    std::chrono::milliseconds get_elapsed() const;
    double get_throughput_mbps() const;
    
    const std::string& get_session_id() const { return session_id_; }
    const std::string& get_client_id() const { return client_id_; }
    SessionRole get_role() const { return role_; }
    
    SessionStats snapshot() const;
    
private:
    bool transition(SessionState to);
    std::chrono::milliseconds elapsed_locked() const;
    double throughput_locked() const;
    
    const std::string session_id_;
    const std::string client_id_;
    const SessionRole role_;
    
    mutable std::mutex mutex_;
    SessionState state_;
    std::optional<core::Result> failure_;
    
    std::uint64_t chunks_;
    std::uint64_t bytes_;
    
    std::chrono::system_clock::time_point created_at_;
    std::chrono::steady_clock::time_point created_steady_;
    std::optional<std::chrono::steady_clock::time_point> started_at_;
    std::optional<std::chrono::steady_clock::time_point> finished_at_;
    std::chrono::steady_clock::time_point last_activity_;
};

}
