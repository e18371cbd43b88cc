#include "tether/core/result.hpp"

namespace tether::core {

const char* to_string(TransferError error) {
    switch (error) {
        case TransferError::SUCCESS: return "SUCCESS";
        case TransferError::CLIENT_NOT_CONNECTED: return "CLIENT_NOT_CONNECTED";
        case TransferError::SESSION_ACTIVE: return "SESSION_ACTIVE";
        case TransferError::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case TransferError::SOURCE_READ_ERROR: return "SOURCE_READ_ERROR";
        case TransferError::SINK_WRITE_ERROR: return "SINK_WRITE_ERROR";
        case TransferError::MALFORMED_ENVELOPE: return "MALFORMED_ENVELOPE";
        case TransferError::CONNECTION_LOST: return "CONNECTION_LOST";
        case TransferError::SEQUENCE_MISMATCH: return "SEQUENCE_MISMATCH";
        case TransferError::SIZE_MISMATCH: return "SIZE_MISMATCH";
        case TransferError::REMOTE_ERROR: return "REMOTE_ERROR";
        case TransferError::SESSION_TIMEOUT: return "SESSION_TIMEOUT";
        case TransferError::INVALID_STATE: return "INVALID_STATE";
    }
    return "UNKNOWN";
}

std::string Result::describe() const {
    if (message.empty()) {
        return to_string(error);
    }
    return std::string(to_string(error)) + ": " + message;
}

}
