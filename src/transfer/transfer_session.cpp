#include "tether/transfer/transfer_session.hpp"
#include "tether/core/logger.hpp"

namespace tether::transfer {

using core::Result;
using core::TransferError;

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::PENDING: return "PENDING";
        case SessionState::IN_PROGRESS: return "IN_PROGRESS";
        case SessionState::COMPLETED: return "COMPLETED";
        case SessionState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

bool is_valid_transition(SessionState from, SessionState to) {
    switch (from) {
        case SessionState::PENDING:
            // Zero-chunk transfers complete straight from PENDING
            return to == SessionState::IN_PROGRESS ||
                   to == SessionState::COMPLETED ||
                   to == SessionState::FAILED;
        case SessionState::IN_PROGRESS:
            return to == SessionState::COMPLETED || to == SessionState::FAILED;
        case SessionState::COMPLETED:
        case SessionState::FAILED:
            return false;
    }
    return false;
}

TransferSession::TransferSession(const std::string& session_id, const std::string& client_id, SessionRole role)
    : session_id_(session_id)
    , client_id_(client_id)
    , role_(role)
    , state_(SessionState::PENDING)
    , chunks_(0)
    , bytes_(0)
    , created_at_(std::chrono::system_clock::now())
    , created_steady_(std::chrono::steady_clock::now())
    , last_activity_(created_steady_)
{
}

Result TransferSession::begin() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (state_ == SessionState::IN_PROGRESS) {
        return Result();
    }
    
    if (!transition(SessionState::IN_PROGRESS)) {
        return Result(TransferError::INVALID_STATE,
                      "Cannot start session " + session_id_ + " in state " + to_string(state_));
    }
    
    started_at_ = std::chrono::steady_clock::now();
    last_activity_ = *started_at_;
    return Result();
}

Result TransferSession::record_chunk(std::uint64_t sequence_index, std::uint64_t byte_count,
                                     bool strict_ordering) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (state_ != SessionState::IN_PROGRESS) {
        return Result(TransferError::INVALID_STATE,
                      "Session " + session_id_ + " is not in progress");
    }
    
    if (strict_ordering && sequence_index != chunks_) {
        Result failure(TransferError::SEQUENCE_MISMATCH,
                       "Expected chunk " + std::to_string(chunks_) +
                       " but received " + std::to_string(sequence_index));
        transition(SessionState::FAILED);
        failure_ = failure;
        return failure;
    }
    
    chunks_++;
    bytes_ += byte_count;
    last_activity_ = std::chrono::steady_clock::now();
    return Result();
}

Result TransferSession::complete(std::uint64_t reported_chunks, std::uint64_t reported_bytes,
                                 bool verify_totals) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (state_ == SessionState::PENDING && chunks_ == 0) {
        started_at_ = std::chrono::steady_clock::now();
    }
    
    if (verify_totals && (reported_chunks != chunks_ || reported_bytes != bytes_)) {
        Result failure(TransferError::SIZE_MISMATCH,
                       "Reported " + std::to_string(reported_chunks) + " chunks / " +
                       std::to_string(reported_bytes) + " bytes but recorded " +
                       std::to_string(chunks_) + " chunks / " + std::to_string(bytes_) + " bytes");
        if (!transition(SessionState::FAILED)) {
            return Result(TransferError::INVALID_STATE,
                          "Session " + session_id_ + " already " + to_string(state_));
        }
        failure_ = failure;
        return failure;
    }
    
    if (!transition(SessionState::COMPLETED)) {
        return Result(TransferError::INVALID_STATE,
                      "Cannot complete session " + session_id_ + " in state " + to_string(state_));
    }
    
    return Result();
}

bool TransferSession::fail(Result reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (!transition(SessionState::FAILED)) {
        return false;
    }
    
    failure_ = std::move(reason);
    return true;
}

SessionState TransferSession::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool TransferSession::is_terminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SessionState::COMPLETED || state_ == SessionState::FAILED;
}

std::optional<Result> TransferSession::get_failure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_;
}

std::uint64_t TransferSession::get_chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_;
}

std::uint64_t TransferSession::get_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_;
}

std::chrono::steady_clock::time_point TransferSession::get_last_activity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

std::chrono::milliseconds TransferSession::get_elapsed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return elapsed_locked();
}

double TransferSession::get_throughput_mbps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return throughput_locked();
}

SessionStats TransferSession::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return SessionStats{
        session_id_,
        client_id_,
        role_,
        state_,
        chunks_,
        bytes_,
        created_at_,
        elapsed_locked(),
        throughput_locked(),
        failure_
    };
}

bool TransferSession::transition(SessionState to) {
    if (!is_valid_transition(state_, to)) {
        return false;
    }
    
    LOG_DEBUG("Session {} {} -> {}", session_id_, to_string(state_), to_string(to));
    state_ = to;
    last_activity_ = std::chrono::steady_clock::now();
    
    if (to == SessionState::COMPLETED || to == SessionState::FAILED) {
        finished_at_ = last_activity_;
    }
    return true;
}

std::chrono::milliseconds TransferSession::elapsed_locked() const {
    if (!started_at_) {
        return std::chrono::milliseconds(0);
    }
    auto end = finished_at_ ? *finished_at_ : std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - *started_at_);
}

double TransferSession::throughput_locked() const {
    auto elapsed = elapsed_locked();
    if (elapsed.count() <= 0) {
        return 0.0;
    }
    return (static_cast<double>(bytes_) / (1024.0 * 1024.0)) / (elapsed.count() / 1000.0);
}

}
