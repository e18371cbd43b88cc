#pragma once

#include "tether/core/config.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tether::core {

enum class OptionValue {
    NONE,
    TEXT,
    NUMBER
};

// Command-line options for the tether executables. An option may be bound
// to a Config key; apply_to() then layers the given value over the loaded
// configuration.
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);
    
    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, OptionValue value = OptionValue::NONE,
                    const std::string& config_key = "");
    
    // Everything after a bare "--" is positional
    bool parse(int argc, char* argv[]);
    
    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    std::optional<std::uint64_t> get_number_option(const std::string& name) const;
    
    // Writes each given option that has a config key; returns how many
    std::size_t apply_to(Config& config) const;
    
    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }
    
    void print_help() const;
    void print_version() const;

private:
    struct Option {
        std::string short_name;
        std::string long_name;
        std::string description;
        OptionValue value;
        std::string config_key;
    };
    
    const Option* find_option(const std::string& name) const;
    bool store(const Option& option, const std::string& value);
    
    std::string program_name_;
    std::vector<Option> options_;
    std::map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
