#include "tether/core/logger.hpp"
#include "tether/core/utils.hpp"
#include <spdlog/pattern_formatter.h>

namespace tether::core {

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::initialize(const std::string& log_file, LogLevel level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    
    std::vector<spdlog::sink_ptr> sinks{console_sink};
    
    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, 1048576 * 5, 3);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
        sinks.push_back(file_sink);
    }
    
    // The file sink keeps debug output even when the console is quieter
    auto logger_level = static_cast<spdlog::level::level_enum>(level);
    if (!log_file.empty() && logger_level > spdlog::level::debug) {
        logger_level = spdlog::level::debug;
    }
    
    logger_ = std::make_shared<spdlog::logger>("tether", sinks.begin(), sinks.end());
    logger_->set_level(logger_level);
    logger_->flush_on(spdlog::level::warn);
    
    spdlog::set_default_logger(logger_);
    
    LOG_INFO("Logger initialized with level: {}", spdlog::level::to_string_view(
        static_cast<spdlog::level::level_enum>(level)));
}

void Logger::shutdown() {
    if (logger_) {
        LOG_INFO("Shutting down logger");
        logger_->flush();
        spdlog::shutdown();
        logger_.reset();
    }
}

std::optional<LogLevel> Logger::parse_level(const std::string& name) {
    auto lower = utils::StringUtils::to_lower(utils::StringUtils::trim(name));
    
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error" || lower == "err") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    
    return std::nullopt;
}

}
