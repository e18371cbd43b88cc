#include "tether/crypto/random.hpp"
#include "tether/core/logger.hpp"
#include "tether/core/utils.hpp"
#include <sodium.h>
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace tether::crypto {

bool SecureRandom::initialized_ = false;

bool SecureRandom::initialize() {
    if (initialized_) {
        return true;
    }
    
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    
    initialized_ = true;
    LOG_DEBUG("Cryptographic random number generator initialized");
    return true;
}

std::uint32_t SecureRandom::generate_uniform(std::uint32_t upper_bound) {
    if (!initialize()) {
        throw std::runtime_error("Random generator not initialized");
    }
    return randombytes_uniform(upper_bound);
}

std::string SecureRandom::generate_hex(std::size_t byte_count) {
    if (!initialize()) {
        throw std::runtime_error("Random generator not initialized");
    }
    
    std::vector<std::uint8_t> bytes(byte_count);
    randombytes_buf(bytes.data(), bytes.size());
    return core::utils::StringUtils::to_hex(bytes.data(), bytes.size());
}

std::string SecureRandom::generate_base36(std::size_t length) {
    static constexpr char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    
    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(alphabet[generate_uniform(36)]);
    }
    return result;
}

std::string SecureRandom::generate_alphanumeric(std::size_t length) {
    static constexpr char alphabet[] =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    static constexpr std::size_t alphabet_size = sizeof(alphabet) - 1;
    // Largest multiple of 62 below 256; bytes above it are redrawn
    static constexpr std::uint8_t limit = 256 - (256 % alphabet_size);
    
    if (!initialize()) {
        throw std::runtime_error("Random generator not initialized");
    }
    
    std::string result;
    result.reserve(length);
    
    std::vector<std::uint8_t> bytes(std::min<std::size_t>(length + length / 4 + 16, 1 << 16));
    while (result.size() < length) {
        randombytes_buf(bytes.data(), bytes.size());
        for (auto byte : bytes) {
            if (byte >= limit) {
                continue;
            }
            result.push_back(alphabet[byte % alphabet_size]);
            if (result.size() == length) {
                break;
            }
        }
    }
    
    return result;
}

}
