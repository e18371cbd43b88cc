#pragma once

#include "tether/core/command_handler.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tether::core {

class CommandRegistry {
public:
    CommandRegistry() = default;
    
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    
    // Runs when the command line names no command
    void set_default_command(const std::string& name) { default_command_ = name; }
    const std::string& get_default_command() const { return default_command_; }
    
    // args[0] selects the handler; empty args run the default command.
    // A handler that throws yields an error result.
    CommandResult execute(std::vector<std::string> args);
    
    bool has_command(const std::string& command) const;
    void print_help() const;

private:
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
    std::string default_command_;
};

}
