#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace tether::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static bool starts_with(const std::string& str, const std::string& prefix);
    
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_megabytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
    static std::string to_hex(const std::uint8_t* data, std::size_t size);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::filesystem::path expand_home(const std::string& path);
    static std::filesystem::path get_home_dir();
};

class TimeUtils {
public:
    static std::chrono::system_clock::time_point now();
    static std::uint64_t epoch_millis(const std::chrono::system_clock::time_point& time);
    static std::string to_iso_string(const std::chrono::system_clock::time_point& time);
};

}
