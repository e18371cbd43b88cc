#include "tether/app/client_commands.hpp"
#include "tether/client/tether_client.hpp"
#include "tether/core/config.hpp"
#include "tether/core/logger.hpp"
#include "tether/core/utils.hpp"
#include "tether/crypto/random.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <thread>

namespace tether::app {

using core::CommandResult;
using core::Result;
using core::TransferError;
using core::utils::StringUtils;

ConnectCommandHandler::ConnectCommandHandler(ShutdownSignal& shutdown)
    : shutdown_(shutdown) {
}

CommandResult ConnectCommandHandler::execute(const std::vector<std::string>& /*args*/) {
    auto& config = core::Config::instance();
    auto settings = client::ClientSettings::from_config(config);
    auto options = client::AgentOptions::from_config(config);
    
    if (!core::utils::FileUtils::is_file(options.file_path)) {
        LOG_WARN("{} does not exist yet; requests will be answered with an error",
                 options.file_path.string());
    }
    
    std::cout << "Client " << options.client_id << " connecting to "
              << settings.server_host << ":" << settings.server_port << "\n";
    
    client::TetherClient tether_client(settings, options);
    
    std::thread watcher([this, &tether_client]() {
        shutdown_.wait();
        tether_client.stop();
    });
    
    tether_client.run();
    
    shutdown_.trigger();
    watcher.join();
    
    return CommandResult::ok("Client stopped");
}

CommandResult GenerateCommandHandler::execute(const std::vector<std::string>& args) {
    std::uint64_t size_mb = 100;
    if (args.size() >= 2) {
        try {
            size_mb = std::stoull(args[1]);
        } catch (const std::exception&) {
            return CommandResult::error("Invalid size: " + args[1]);
        }
    }
    
    auto path = core::utils::FileUtils::expand_home(
        core::Config::instance().get_string("client.file_path", "~/file_to_download.txt"));
    
    std::cout << "Generating " << size_mb << " MB at " << path.string() << "\n";
    
    auto result = generate_text_file(path, size_mb * 1024 * 1024);
    if (!result) {
        return CommandResult::error(result.describe());
    }
    
    return CommandResult::ok("Generated " + path.string());
}

Result generate_text_file(const std::filesystem::path& path, std::uint64_t size_bytes,
                          std::uint64_t progress_step) {
    if (path.has_parent_path() && !core::utils::FileUtils::create_directories(path.parent_path())) {
        return Result(TransferError::SINK_WRITE_ERROR, "Cannot create " + path.parent_path().string());
    }
    
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Result(TransferError::SINK_WRITE_ERROR, "Cannot open " + path.string());
    }
    
    constexpr std::uint64_t block_size = 1024 * 1024;
    std::uint64_t written = 0;
    std::uint64_t next_report = progress_step;
    
    while (written < size_bytes) {
        auto block = crypto::SecureRandom::generate_alphanumeric(
            static_cast<std::size_t>(std::min(block_size, size_bytes - written)));
        file.write(block.data(), static_cast<std::streamsize>(block.size()));
        if (!file) {
            return Result(TransferError::SINK_WRITE_ERROR, "Failed to write " + path.string());
        }
        
        written += block.size();
        if (progress_step > 0 && written >= next_report) {
            LOG_INFO("Generated {} MB of {} MB", StringUtils::format_megabytes(written),
                     StringUtils::format_megabytes(size_bytes));
            next_report += progress_step;
        }
    }
    
    file.close();
    if (file.fail()) {
        return Result(TransferError::SINK_WRITE_ERROR, "Failed to close " + path.string());
    }
    
    LOG_INFO("Generated {} ({})", path.string(), StringUtils::format_bytes(size_bytes));
    return Result();
}

}
