#include "tether/network/envelope.hpp"
#include "tether/crypto/base64.hpp"
#include "tether/network/protocol.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace tether::network {

using json = nlohmann::json;

static_assert((MAX_CHUNK_SIZE + 2) / 3 * 4 + 4096 <= MAX_FRAME_PAYLOAD);

namespace {
    constexpr const char* TYPE_REGISTER = "register";
    constexpr const char* TYPE_REGISTERED = "registered";
    constexpr const char* TYPE_DOWNLOAD_REQUEST = "download-request";
    constexpr const char* TYPE_CHUNK = "file-chunk";
    constexpr const char* TYPE_COMPLETE = "file-complete";
    constexpr const char* TYPE_ERROR = "error";
    
    template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
    
    std::string require_string(const json& object, const char* field) {
        auto it = object.find(field);
        if (it == object.end() || !it->is_string()) {
            throw std::invalid_argument(std::string("missing string field '") + field + "'");
        }
        return it->get<std::string>();
    }
    
    std::uint64_t require_count(const json& object, const char* field) {
        auto it = object.find(field);
        if (it == object.end() || !it->is_number_unsigned()) {
            // Non-negative integers written by other encoders may parse as signed
            if (it != object.end() && it->is_number_integer() && it->get<std::int64_t>() >= 0) {
                return it->get<std::uint64_t>();
            }
            throw std::invalid_argument(std::string("missing unsigned field '") + field + "'");
        }
        return it->get<std::uint64_t>();
    }
    
    std::optional<std::string> optional_string(const json& object, const char* field) {
        auto it = object.find(field);
        if (it == object.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_string()) {
            throw std::invalid_argument(std::string("field '") + field + "' is not a string");
        }
        return it->get<std::string>();
    }
    
    void put_optional(json& object, const char* field, const std::optional<std::string>& value) {
        if (value) {
            object[field] = *value;
        }
    }
}

ChunkMessage ChunkMessage::from_bytes(const std::string& session_id, std::uint64_t sequence_index,
                                      std::span<const std::uint8_t> bytes) {
    return ChunkMessage{session_id, sequence_index, crypto::Base64::encode(bytes), std::nullopt};
}

std::optional<std::vector<std::uint8_t>> ChunkMessage::decode_payload() const {
    return crypto::Base64::decode(payload_base64);
}

std::string encode_envelope(const Envelope& envelope) {
    json object = std::visit(overloaded{
        [](const RegisterMessage& msg) {
            return json{{"type", TYPE_REGISTER}, {"clientId", msg.client_id}};
        },
        [](const RegisteredMessage& msg) {
            return json{{"type", TYPE_REGISTERED}, {"clientId", msg.client_id}};
        },
        [](const DownloadRequestMessage& msg) {
            return json{{"type", TYPE_DOWNLOAD_REQUEST}, {"downloadId", msg.session_id}};
        },
        [](const ChunkMessage& msg) {
            json out{{"type", TYPE_CHUNK},
                     {"downloadId", msg.session_id},
                     {"chunkIndex", msg.sequence_index},
                     {"chunk", msg.payload_base64}};
            put_optional(out, "clientId", msg.client_id);
            return out;
        },
        [](const CompleteMessage& msg) {
            json out{{"type", TYPE_COMPLETE},
                     {"downloadId", msg.session_id},
                     {"totalChunks", msg.total_chunks},
                     {"fileSize", msg.total_bytes}};
            put_optional(out, "clientId", msg.client_id);
            return out;
        },
        [](const ErrorMessage& msg) {
            json out{{"type", TYPE_ERROR}, {"error", msg.message}};
            put_optional(out, "downloadId", msg.session_id);
            put_optional(out, "clientId", msg.client_id);
            return out;
        },
        [](const MalformedMessage&) -> json {
            throw std::logic_error("Malformed envelopes cannot be encoded");
        }
    }, envelope);
    
    return object.dump();
}

Envelope decode_envelope(std::string_view text) {
    json object = json::parse(text.begin(), text.end(), nullptr, false);
    if (object.is_discarded()) {
        return MalformedMessage{"payload is not valid JSON"};
    }
    if (!object.is_object()) {
        return MalformedMessage{"payload is not a JSON object"};
    }
    
    auto type_it = object.find("type");
    if (type_it == object.end() || !type_it->is_string()) {
        return MalformedMessage{"missing message type"};
    }
    
    const auto type = type_it->get<std::string>();
    
    try {
        if (type == TYPE_REGISTER) {
            return RegisterMessage{require_string(object, "clientId")};
        }
        if (type == TYPE_REGISTERED) {
            return RegisteredMessage{require_string(object, "clientId")};
        }
        if (type == TYPE_DOWNLOAD_REQUEST) {
            return DownloadRequestMessage{require_string(object, "downloadId")};
        }
        if (type == TYPE_CHUNK) {
            return ChunkMessage{require_string(object, "downloadId"),
                                require_count(object, "chunkIndex"),
                                require_string(object, "chunk"),
                                optional_string(object, "clientId")};
        }
        if (type == TYPE_COMPLETE) {
            return CompleteMessage{require_string(object, "downloadId"),
                                   require_count(object, "totalChunks"),
                                   require_count(object, "fileSize"),
                                   optional_string(object, "clientId")};
        }
        if (type == TYPE_ERROR) {
            return ErrorMessage{optional_string(object, "downloadId"),
                                require_string(object, "error"),
                                optional_string(object, "clientId")};
        }
    } catch (const std::exception& e) {
        return MalformedMessage{type + ": " + e.what()};
    }
    
    return MalformedMessage{"unknown message type '" + type + "'"};
}

const char* envelope_type_name(const Envelope& envelope) {
    return std::visit(overloaded{
        [](const RegisterMessage&) { return "REGISTER"; },
        [](const RegisteredMessage&) { return "REGISTERED"; },
        [](const DownloadRequestMessage&) { return "DOWNLOAD_REQUEST"; },
        [](const ChunkMessage&) { return "CHUNK"; },
        [](const CompleteMessage&) { return "COMPLETE"; },
        [](const ErrorMessage&) { return "ERROR"; },
        [](const MalformedMessage&) { return "MALFORMED"; }
    }, envelope);
}

std::optional<std::string> envelope_session_id(const Envelope& envelope) {
    return std::visit(overloaded{
        [](const DownloadRequestMessage& msg) -> std::optional<std::string> { return msg.session_id; },
        [](const ChunkMessage& msg) -> std::optional<std::string> { return msg.session_id; },
        [](const CompleteMessage& msg) -> std::optional<std::string> { return msg.session_id; },
        [](const ErrorMessage& msg) -> std::optional<std::string> { return msg.session_id; },
        [](const auto&) -> std::optional<std::string> { return std::nullopt; }
    }, envelope);
}

}
