#include "core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace viewport_coordinator::logging {

LogConfig LoggerFactory::config_ = {};
bool LoggerFactory::configured_ = false;
std::vector<spdlog::sink_ptr> LoggerFactory::sinks_;

LogLevel toLogLevel(AppLogLevel level) {
    switch (level) {
        case AppLogLevel::Exception:   return LogLevel::Critical;
        case AppLogLevel::Error:       return LogLevel::Error;
        case AppLogLevel::Information: return LogLevel::Info;
        case AppLogLevel::Debug:       return LogLevel::Debug;
    }
    return LogLevel::Info;
}

std::shared_ptr<spdlog::logger> LoggerFactory::create(const std::string& name) {
    auto existingLogger = spdlog::get(name);
    if (existingLogger) {
        return existingLogger;
    }

    if (sinks_.empty()) {
        if (config_.enableConsoleLogging) {
            sinks_.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
        if (config_.enableFileLogging && !config_.logDirectory.empty()) {
            auto logFile = config_.logDirectory / config_.fileName;
            sinks_.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile.string(),
                config_.maxFileSize,
                config_.maxFiles
            ));
        }
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks_.begin(), sinks_.end());
    logger->set_level(static_cast<spdlog::level::level_enum>(config_.level));
    logger->set_pattern(config_.pattern);

    spdlog::register_logger(logger);

    return logger;
}

void LoggerFactory::configure(const LogConfig& config) {
    config_ = config;
    configured_ = true;

    // Sinks are rebuilt lazily so a new file location takes effect
    sinks_.clear();
    spdlog::drop_all();

    spdlog::set_level(static_cast<spdlog::level::level_enum>(config.level));
    spdlog::set_pattern(config.pattern);
}

void LoggerFactory::setGlobalLevel(LogLevel level) {
    config_.level = level;
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));

    spdlog::apply_all([level](std::shared_ptr<spdlog::logger> logger) {
        logger->set_level(static_cast<spdlog::level::level_enum>(level));
    });
}

void LoggerFactory::setAppLevel(AppLogLevel level) {
    setGlobalLevel(toLogLevel(level));
}

LogLevel LoggerFactory::getGlobalLevel() {
    return config_.level;
}

void LoggerFactory::shutdown() {
    spdlog::shutdown();
    sinks_.clear();
    configured_ = false;
}

}  // namespace viewport_coordinator::logging
