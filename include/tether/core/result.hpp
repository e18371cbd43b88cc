#pragma once

#include <string>

namespace tether::core {

// Error types for protocol and administrative operations
enum class TransferError {
    SUCCESS = 0,
    CLIENT_NOT_CONNECTED,
    SESSION_ACTIVE,
    FILE_NOT_FOUND,
    SOURCE_READ_ERROR,
    SINK_WRITE_ERROR,
    MALFORMED_ENVELOPE,
    CONNECTION_LOST,
    SEQUENCE_MISMATCH,
    SIZE_MISMATCH,
    REMOTE_ERROR,
    SESSION_TIMEOUT,
    INVALID_STATE
};

const char* to_string(TransferError error);

struct Result {
    TransferError error;
    std::string message;
    
    Result(TransferError err = TransferError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == TransferError::SUCCESS; }
    operator bool() const { return success(); }
    
    std::string describe() const;
};

}
