#pragma once

#include "tether/app/shutdown_signal.hpp"
#include "tether/core/command_handler.hpp"
#include "tether/core/result.hpp"
#include <filesystem>

namespace tether::app {

class ConnectCommandHandler : public core::CommandHandler {
public:
    explicit ConnectCommandHandler(ShutdownSignal& shutdown);
    
    core::CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Connect to the server and serve file requests"; }
    std::string get_usage() const override { return "connect"; }

private:
    ShutdownSignal& shutdown_;
};

class GenerateCommandHandler : public core::CommandHandler {
public:
    core::CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Write a random text file to serve"; }
    std::string get_usage() const override { return "generate [size_mb]"; }
};

// Writes size_bytes of random alphanumeric text, logging every progress_step bytes
core::Result generate_text_file(const std::filesystem::path& path, std::uint64_t size_bytes,
                                std::uint64_t progress_step = 10 * 1024 * 1024);

}
