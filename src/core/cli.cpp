#include "tether/core/cli.hpp"
#include "tether/network/protocol.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>

namespace tether::core {

namespace {
    bool is_number(const std::string& value) {
        return !value.empty() &&
               std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
    }
}

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {
    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file (default: ~/.tether.conf)", OptionValue::TEXT);
    add_option("", "verbose", "Log at debug level", OptionValue::NONE);
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, OptionValue value,
                                   const std::string& config_key) {
    options_.push_back(Option{short_name, long_name, description, value, config_key});
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();
    
    bool options_done = false;
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (options_done || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(arg);
            continue;
        }
        
        if (arg == "--") {
            options_done = true;
            continue;
        }
        
        std::string name;
        std::optional<std::string> inline_value;
        
        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
            if (eq_pos != std::string::npos) {
                inline_value = arg.substr(eq_pos + 1);
            }
        } else {
            // -p8080 and -p 8080 are both accepted
            name = arg.substr(1, 1);
            if (arg.length() > 2) {
                inline_value = arg.substr(2);
            }
        }
        
        const Option* option = find_option(name);
        if (!option) {
            error_ = "Unknown option: " + arg;
            return false;
        }
        
        if (option->value == OptionValue::NONE) {
            if (inline_value) {
                error_ = "Option --" + option->long_name + " does not take a value";
                return false;
            }
            parsed_options_[option->long_name] = "true";
            continue;
        }
        
        if (!inline_value) {
            if (i + 1 >= argc) {
                error_ = "Option --" + option->long_name + " requires a value";
                return false;
            }
            inline_value = argv[++i];
        }
        
        if (!store(*option, *inline_value)) {
            return false;
        }
    }
    
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    const Option* option = find_option(name);
    return option && parsed_options_.count(option->long_name) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    const Option* option = find_option(name);
    if (!option) {
        return default_value;
    }
    
    auto it = parsed_options_.find(option->long_name);
    return it != parsed_options_.end() ? it->second : default_value;
}

std::optional<std::uint64_t> CommandLineParser::get_number_option(const std::string& name) const {
    auto value = get_option(name);
    if (!is_number(value)) {
        return std::nullopt;
    }
    
    try {
        return std::stoull(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::size_t CommandLineParser::apply_to(Config& config) const {
    std::size_t applied = 0;
    for (const auto& option : options_) {
        if (option.config_key.empty()) {
            continue;
        }
        
        auto it = parsed_options_.find(option.long_name);
        if (it != parsed_options_.end()) {
            config.set(option.config_key, it->second);
            applied++;
        }
    }
    return applied;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] [command] [args...]\n\n";
    std::cout << "Options:\n";
    
    for (const auto& option : options_) {
        std::string flags = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        flags += "--" + option.long_name;
        if (option.value == OptionValue::TEXT) {
            flags += " <value>";
        } else if (option.value == OptionValue::NUMBER) {
            flags += " <n>";
        }
        
        std::cout << "  " << std::left << std::setw(30) << flags << option.description;
        if (!option.config_key.empty()) {
            std::cout << " [" << option.config_key << "]";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 1.0.0\n";
    std::cout << "Wire protocol version " << network::PROTOCOL_VERSION << "\n";
}

const CommandLineParser::Option* CommandLineParser::find_option(const std::string& name) const {
    auto it = std::find_if(options_.begin(), options_.end(), [&name](const Option& option) {
        return option.long_name == name || (!option.short_name.empty() && option.short_name == name);
    });
    return it != options_.end() ? &*it : nullptr;
}

bool CommandLineParser::store(const Option& option, const std::string& value) {
    if (option.value == OptionValue::NUMBER && !is_number(value)) {
        error_ = "Option --" + option.long_name + " expects a number, got '" + value + "'";
        return false;
    }
    
    parsed_options_[option.long_name] = value;
    return true;
}

}
