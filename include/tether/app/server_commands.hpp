#pragma once

#include "tether/app/shutdown_signal.hpp"
#include "tether/core/command_handler.hpp"
#include "tether/server/fetch_server.hpp"
#include <optional>

namespace tether::app {

class ServeCommandHandler : public core::CommandHandler {
public:
    explicit ServeCommandHandler(ShutdownSignal& shutdown);
    
    core::CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Accept clients until interrupted"; }
    std::string get_usage() const override { return "serve"; }

private:
    ShutdownSignal& shutdown_;
};

class DownloadCommandHandler : public core::CommandHandler {
public:
    explicit DownloadCommandHandler(ShutdownSignal& shutdown);
    
    core::CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Wait for a client and pull its file"; }
    std::string get_usage() const override { return "download <clientId>"; }

private:
    ShutdownSignal& shutdown_;
};

class ListCommandHandler : public core::CommandHandler {
public:
    explicit ListCommandHandler(ShutdownSignal& shutdown);
    
    core::CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show clients that connect within the wait window"; }
    std::string get_usage() const override { return "list"; }

private:
    ShutdownSignal& shutdown_;
};

// Waits for client_id to register, triggers one download and waits for it
// to finish. Returns the final session state, or nothing when interrupted.
std::optional<transfer::SessionStats> run_download(server::FetchService& service,
                                                   const std::string& client_id,
                                                   ShutdownSignal& shutdown,
                                                   std::chrono::milliseconds poll_interval,
                                                   std::string& error);

void print_clients(const std::vector<server::ClientInfo>& clients);

}
