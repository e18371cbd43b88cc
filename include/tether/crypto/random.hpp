#pragma once

#include <cstdint>
#include <string>

namespace tether::crypto {

class SecureRandom {
public:
    static bool initialize();
    static bool is_initialized() { return initialized_; }
    
    static std::uint32_t generate_uniform(std::uint32_t upper_bound);
    
    // Lowercase hex string of byte_count random bytes
    static std::string generate_hex(std::size_t byte_count);
    
    // Characters drawn uniformly from [0-9a-z]
    static std::string generate_base36(std::size_t length);
    
    // Characters drawn uniformly from [0-9A-Za-z]
    static std::string generate_alphanumeric(std::size_t length);

private:
    static bool initialized_;
};

}
