#include "tether/app/server_commands.hpp"
#include "tether/core/config.hpp"
#include "tether/core/logger.hpp"
#include "tether/core/utils.hpp"
#include <iomanip>
#include <iostream>

namespace tether::app {

using core::CommandResult;
using core::utils::StringUtils;
using core::utils::TimeUtils;

namespace {
    std::unique_ptr<server::FetchServer> make_server() {
        auto& config = core::Config::instance();
        return std::make_unique<server::FetchServer>(
            server::ServerSettings::from_config(config),
            server::ServiceOptions::from_config(config));
    }
}

ServeCommandHandler::ServeCommandHandler(ShutdownSignal& shutdown)
    : shutdown_(shutdown) {
}

CommandResult ServeCommandHandler::execute(const std::vector<std::string>& /*args*/) {
    auto server = make_server();
    if (!server->start()) {
        return CommandResult::error("Failed to start server");
    }
    
    std::cout << "Server running on port " << server->get_port() << "\n";
    std::cout << "Press Ctrl+C to stop\n";
    
    shutdown_.wait();
    server->stop();
    
    return CommandResult::ok("Server stopped");
}

DownloadCommandHandler::DownloadCommandHandler(ShutdownSignal& shutdown)
    : shutdown_(shutdown) {
}

CommandResult DownloadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    const std::string& client_id = args[1];
    
    auto server = make_server();
    if (!server->start()) {
        return CommandResult::error("Failed to start server");
    }
    
    std::cout << "Waiting for client " << client_id << " on port " << server->get_port() << "\n";
    
    std::string error;
    auto stats = run_download(server->get_service(), client_id, shutdown_,
                              std::chrono::seconds(1), error);
    server->stop();
    
    if (!stats) {
        return CommandResult::error(error.empty() ? "Interrupted" : error);
    }
    
    if (stats->state != transfer::SessionState::COMPLETED) {
        return CommandResult::error("Download " + stats->session_id + " failed: " +
                                    (stats->failure ? stats->failure->describe() : "unknown error"));
    }
    
    std::cout << "Downloaded " << StringUtils::format_bytes(stats->bytes)
              << " in " << stats->chunks << " chunks ("
              << StringUtils::format_duration(stats->elapsed) << ", "
              << std::fixed << std::setprecision(2) << stats->throughput_mbps << " MB/s)\n";
    
    return CommandResult::ok("Download " + stats->session_id + " complete");
}

ListCommandHandler::ListCommandHandler(ShutdownSignal& shutdown)
    : shutdown_(shutdown) {
}

CommandResult ListCommandHandler::execute(const std::vector<std::string>& /*args*/) {
    auto server = make_server();
    if (!server->start()) {
        return CommandResult::error("Failed to start server");
    }
    
    auto wait = std::chrono::milliseconds(core::Config::instance().get_uint64("cli.list_wait_ms", 2000));
    std::cout << "Waiting " << wait.count() << "ms for clients on port " << server->get_port() << "\n";
    shutdown_.wait_for(wait);
    
    print_clients(server->get_service().list_clients());
    server->stop();
    
    return CommandResult::ok();
}

std::optional<transfer::SessionStats> run_download(server::FetchService& service,
                                                   const std::string& client_id,
                                                   ShutdownSignal& shutdown,
                                                   std::chrono::milliseconds poll_interval,
                                                   std::string& error) {
    while (!service.get_registry().lookup(client_id)) {
        LOG_DEBUG("Client {} not connected yet", client_id);
        if (shutdown.wait_for(poll_interval)) {
            return std::nullopt;
        }
    }
    
    auto ticket = service.trigger_download(client_id);
    if (!ticket.accepted()) {
        error = ticket.result.describe();
        return std::nullopt;
    }
    
    LOG_INFO("Download {} {}", ticket.session_id, ticket.status);
    
    while (true) {
        auto stats = service.session_status(ticket.session_id);
        if (!stats) {
            error = "Session " + ticket.session_id + " disappeared";
            return std::nullopt;
        }
        
        if (stats->state == transfer::SessionState::COMPLETED ||
            stats->state == transfer::SessionState::FAILED) {
            return stats;
        }
        
        if (shutdown.wait_for(std::chrono::milliseconds(200))) {
            return std::nullopt;
        }
    }
}

void print_clients(const std::vector<server::ClientInfo>& clients) {
    std::cout << "Connected clients: " << clients.size() << "\n";
    
    for (const auto& client : clients) {
        std::cout << "  " << std::left << std::setw(24) << client.client_id
                  << " connected " << TimeUtils::to_iso_string(client.connected_at)
                  << " from " << client.remote_endpoint;
        if (client.active_session_id) {
            std::cout << " (downloading " << *client.active_session_id << ")";
        }
        std::cout << "\n";
    }
}

}
