#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tether::network {

// Largest raw chunk whose base64 CHUNK envelope still fits in one frame
constexpr std::size_t MAX_CHUNK_SIZE = 8 * 1024 * 1024;

struct RegisterMessage {
    std::string client_id;
};

struct RegisteredMessage {
    std::string client_id;
};

struct DownloadRequestMessage {
    std::string session_id;
};

struct ChunkMessage {
    std::string session_id;
    std::uint64_t sequence_index;
    std::string payload_base64;
    std::optional<std::string> client_id;
    
    static ChunkMessage from_bytes(const std::string& session_id, std::uint64_t sequence_index,
                                   std::span<const std::uint8_t> bytes);
    std::optional<std::vector<std::uint8_t>> decode_payload() const;
};

struct CompleteMessage {
    std::string session_id;
    std::uint64_t total_chunks;
    std::uint64_t total_bytes;
    std::optional<std::string> client_id;
};

struct ErrorMessage {
    std::optional<std::string> session_id;
    std::string message;
    std::optional<std::string> client_id;
};

// Produced only by the decoder for frames that are not a known envelope
struct MalformedMessage {
    std::string reason;
};

using Envelope = std::variant<RegisterMessage,
                              RegisteredMessage,
                              DownloadRequestMessage,
                              ChunkMessage,
                              CompleteMessage,
                              ErrorMessage,
                              MalformedMessage>;

std::string encode_envelope(const Envelope& envelope);
Envelope decode_envelope(std::string_view text);

const char* envelope_type_name(const Envelope& envelope);
std::optional<std::string> envelope_session_id(const Envelope& envelope);

}
