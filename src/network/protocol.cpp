#include "tether/network/protocol.hpp"
#include <stdexcept>

namespace tether::network {

namespace {
    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw std::runtime_error("Insufficient data for uint32");
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }
    
    std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
        if (data.size() < 2) throw std::runtime_error("Insufficient data for uint16");
        std::uint16_t value = (static_cast<std::uint16_t>(data[0]) << 8) |
                             static_cast<std::uint16_t>(data[1]);
        data = data.subspan(2);
        return value;
    }
}

FrameHeader::FrameHeader() 
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , flags(0)
    , payload_size(0) {
}

FrameHeader::FrameHeader(std::uint32_t payload_len)
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , flags(0)
    , payload_size(payload_len) {
}

bool FrameHeader::is_valid() const {
    return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION &&
           payload_size <= MAX_FRAME_PAYLOAD;
}

std::vector<std::uint8_t> FrameHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(FRAME_HEADER_SIZE);
    
    write_uint32(buffer, magic);
    write_uint16(buffer, version);
    write_uint16(buffer, flags);
    write_uint32(buffer, payload_size);
    
    return buffer;
}

FrameHeader FrameHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < FRAME_HEADER_SIZE) {
        throw std::runtime_error("Insufficient data for frame header");
    }
    
    FrameHeader header;
    auto span = data;
    
    header.magic = read_uint32(span);
    header.version = read_uint16(span);
    header.flags = read_uint16(span);
    header.payload_size = read_uint32(span);
    
    return header;
}

std::vector<std::uint8_t> build_frame(std::string_view payload) {
    if (payload.size() > MAX_FRAME_PAYLOAD) {
        throw std::length_error("Frame payload exceeds maximum size");
    }
    
    FrameHeader header(static_cast<std::uint32_t>(payload.size()));
    auto frame = header.serialize();
    frame.reserve(FRAME_HEADER_SIZE + payload.size());
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

}
