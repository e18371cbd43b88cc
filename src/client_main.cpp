#include <iostream>
#include <string>
#include <vector>
#include "tether/app/client_commands.hpp"
#include "tether/app/shutdown_signal.hpp"
#include "tether/core/cli.hpp"
#include "tether/core/command_registry.hpp"
#include "tether/core/config.hpp"
#include "tether/core/logger.hpp"
#include "tether/core/utils.hpp"
#include "tether/crypto/random.hpp"

int main(int argc, char* argv[]) {
    tether::core::CommandLineParser parser("tether-client");
    parser.add_option("", "server-host", "Server host name or address", tether::core::OptionValue::TEXT,
                      "client.server_host");
    parser.add_option("", "server-port", "Server port", tether::core::OptionValue::NUMBER, "client.server_port");
    parser.add_option("i", "client-id", "Id to register with (random when unset)", tether::core::OptionValue::TEXT,
                      "client.id");
    parser.add_option("f", "file", "File served on request", tether::core::OptionValue::TEXT, "client.file_path");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    auto& config = tether::core::Config::instance();
    config.set_defaults();
    
    auto config_file = tether::core::utils::FileUtils::expand_home(parser.get_option("config", "~/.tether.conf"));
    if (tether::core::utils::FileUtils::exists(config_file)) {
        config.load_from_file(config_file.string());
    }
    config.load_from_environment();
    
    parser.apply_to(config);
    
    auto log_level = tether::core::Logger::parse_level(config.get_string("log.level", "info"))
        .value_or(tether::core::LogLevel::Info);
    if (parser.has_option("verbose")) {
        log_level = tether::core::LogLevel::Debug;
    }
    tether::core::Logger::initialize(config.get_string("log.file", "tether.log"), log_level);
    
    tether::app::ShutdownSignal shutdown;
    
    tether::core::CommandRegistry command_registry;
    command_registry.register_command("connect", std::make_unique<tether::app::ConnectCommandHandler>(shutdown));
    command_registry.register_command("generate", std::make_unique<tether::app::GenerateCommandHandler>());
    
    command_registry.set_default_command("connect");
    
    if (parser.has_option("help")) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    if (!tether::crypto::SecureRandom::initialize()) {
        std::cerr << "Error: failed to initialize random number generator\n";
        return 1;
    }
    
    const auto& args = parser.get_positional_args();
    std::string command = args.empty() ? command_registry.get_default_command() : args[0];
    shutdown.install();
    
    LOG_INFO("tether-client starting ({})", command);
    auto result = command_registry.execute(args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }
    
    tether::core::Logger::shutdown();
    return result.exit_code;
}
