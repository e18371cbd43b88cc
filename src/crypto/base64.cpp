#include "tether/crypto/base64.hpp"
#include <sodium.h>

namespace tether::crypto {

namespace {
    constexpr int VARIANT = sodium_base64_VARIANT_ORIGINAL;
}

std::size_t Base64::encoded_length(std::size_t binary_length) {
    // sodium counts the trailing NUL
    return sodium_base64_ENCODED_LEN(binary_length, VARIANT) - 1;
}

std::string Base64::encode(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        return "";
    }
    
    std::string output(sodium_base64_ENCODED_LEN(data.size(), VARIANT), '\0');
    sodium_bin2base64(output.data(), output.size(), data.data(), data.size(), VARIANT);
    output.resize(output.size() - 1);
    return output;
}

std::optional<std::vector<std::uint8_t>> Base64::decode(std::string_view text) {
    if (text.empty()) {
        return std::vector<std::uint8_t>{};
    }
    
    std::vector<std::uint8_t> output(text.size() / 4 * 3 + 3);
    std::size_t decoded_length = 0;
    const char* end = nullptr;
    
    if (sodium_base642bin(output.data(), output.size(),
                          text.data(), text.size(),
                          nullptr, &decoded_length, &end, VARIANT) != 0) {
        return std::nullopt;
    }
    
    if (end != text.data() + text.size()) {
        return std::nullopt;
    }
    
    output.resize(decoded_length);
    return output;
}

}
