#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace tether::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x54455448; // "TETH"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t FRAME_HEADER_SIZE = 12;
constexpr std::uint32_t MAX_FRAME_PAYLOAD = 16 * 1024 * 1024;

// Fixed-size prefix of every frame; the payload is one JSON envelope
struct FrameHeader {
    std::uint32_t magic;           // Protocol magic number
    std::uint16_t version;         // Protocol version
    std::uint16_t flags;           // Reserved, zero
    std::uint32_t payload_size;    // Payload length in bytes
    
    FrameHeader();
    explicit FrameHeader(std::uint32_t payload_len);
    
    bool is_valid() const;
    
    std::vector<std::uint8_t> serialize() const;
    static FrameHeader deserialize(std::span<const std::uint8_t> data);
};

static_assert(sizeof(FrameHeader) == FRAME_HEADER_SIZE);

// Header followed by the text payload, ready for the socket
std::vector<std::uint8_t> build_frame(std::string_view payload);

}
