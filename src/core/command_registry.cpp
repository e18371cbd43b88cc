#include "tether/core/command_registry.hpp"
#include "tether/core/logger.hpp"
#include <iomanip>
#include <iostream>

namespace tether::core {

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute(std::vector<std::string> args) {
    if (args.empty()) {
        if (default_command_.empty()) {
            return CommandResult::error("No command given");
        }
        args.push_back(default_command_);
    }
    
    auto it = handlers_.find(args[0]);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + args[0]);
    }
    
    LOG_DEBUG("Running command '{}' with {} argument(s)", args[0], args.size() - 1);
    
    try {
        return it->second->execute(args);
    } catch (const std::exception& e) {
        LOG_ERROR("Command '{}' failed: {}", args[0], e.what());
        return CommandResult::error(args[0] + " failed: " + e.what());
    }
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.count(command) > 0;
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    
    for (const auto& [name, handler] : handlers_) {
        std::string label = name == default_command_ ? name + " *" : name;
        std::cout << "  " << std::left << std::setw(15) << label
                  << handler->get_description() << "\n";
        std::cout << "  " << std::setw(15) << " " << "Usage: " << handler->get_usage() << "\n";
    }
    
    if (!default_command_.empty()) {
        std::cout << "\n  * runs when no command is given\n";
    }
}

}
