#include "tether/core/config.hpp"
#include "tether/core/logger.hpp"
#include "tether/core/utils.hpp"
#include <array>
#include <cstdlib>
#include <utility>

namespace tether::core {

namespace {
    constexpr std::array<std::pair<const char*, const char*>, 11> ENVIRONMENT_KEYS{{
        {"TETHER_PORT", "server.port"},
        {"TETHER_BIND_ADDRESS", "server.bind_address"},
        {"TETHER_DOWNLOAD_DIR", "server.download_dir"},
        {"TETHER_SERVER_HOST", "client.server_host"},
        {"TETHER_SERVER_PORT", "client.server_port"},
        {"TETHER_CLIENT_ID", "client.id"},
        {"TETHER_FILE_PATH", "client.file_path"},
        {"TETHER_CHUNK_SIZE", "transfer.chunk_size"},
        {"TETHER_RECONNECT_INTERVAL_MS", "client.reconnect_interval_ms"},
        {"TETHER_LOG_LEVEL", "log.level"},
        {"TETHER_LOG_FILE", "log.file"},
    }};
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    // "[server]" followed by "port=9000" sets server.port
    std::string section;
    std::string line;
    int line_number = 0;
    
    while (std::getline(file, line)) {
        line_number++;
        line = trim(line);
        
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }
        
        auto eq_pos = line.find('=');
        std::string key = eq_pos == std::string::npos ? "" : trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: ignoring malformed line '{}'", filename, line_number, line);
            continue;
        }
        
        if (!section.empty()) {
            key = section + "." + key;
        }
        values_[key] = trim(line.substr(eq_pos + 1));
    }
    
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# Tether configuration\n";
    
    std::string section;
    for (const auto& [key, value] : values_) {
        auto dot = key.find('.');
        std::string key_section = dot == std::string::npos ? "" : key.substr(0, dot);
        
        if (key_section != section) {
            section = key_section;
            file << "\n[" << section << "]\n";
        }
        
        file << (section.empty() ? key : key.substr(dot + 1)) << "=" << value << "\n";
    }
    
    return file.good();
}

int Config::load_from_environment() {
    int applied = 0;
    
    for (const auto& [variable, key] : ENVIRONMENT_KEYS) {
        const char* value = std::getenv(variable);
        if (value && *value) {
            values_[key] = trim(value);
            applied++;
        }
    }
    
    return applied;
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    std::string lower = utils::StringUtils::to_lower(*value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return default_value;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::uint64_t Config::get_uint64(const std::string& key, std::uint64_t default_value) const {
    auto value = get_as<std::uint64_t>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["server.port"] = "8080";
    values_["server.bind_address"] = "0.0.0.0";
    values_["server.download_dir"] = "downloads";
    values_["server.sweep_interval_ms"] = "5000";
    values_["client.server_host"] = "localhost";
    values_["client.server_port"] = "8080";
    values_["client.file_path"] = (utils::FileUtils::get_home_dir() / "file_to_download.txt").string();
    values_["client.reconnect_interval_ms"] = "5000";
    values_["transfer.chunk_size"] = "65536";
    values_["transfer.send_window"] = "1";
    values_["transfer.progress_interval"] = "100";
    values_["transfer.session_timeout_ms"] = "300000";
    values_["transfer.verify_sequence"] = "true";
    values_["transfer.verify_totals"] = "true";
    values_["transfer.keep_partial_files"] = "false";
    values_["cli.list_wait_ms"] = "2000";
    values_["log.level"] = "info";
    values_["log.file"] = "tether.log";
}

std::string Config::trim(const std::string& str) const {
    return utils::StringUtils::trim(str);
}

}
