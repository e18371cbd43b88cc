#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tether::crypto {

// Standard alphabet with padding, the form chunk payloads travel in
class Base64 {
public:
    static std::string encode(std::span<const std::uint8_t> data);
    static std::optional<std::vector<std::uint8_t>> decode(std::string_view text);
    
    static std::size_t encoded_length(std::size_t binary_length);
};

}
