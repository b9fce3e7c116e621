#include "core/logging/Logging.hpp"
#include <filesystem>
#include <iostream>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace synapse {
namespace core {
namespace logging {

namespace {
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";
constexpr const char* kConsolePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
}

nlohmann::json LoggingConfig::toJson() const {
    return {
        {"level", level},
        {"logPath", logPath},
        {"maxLogSize", maxLogSize},
        {"maxLogFiles", maxLogFiles},
        {"console", console}
    };
}

LoggingConfig LoggingConfig::fromJson(const nlohmann::json& j) {
    LoggingConfig config;
    config.level = j.value("level", config.level);
    config.logPath = j.value("logPath", config.logPath);
    config.maxLogSize = j.value("maxLogSize", config.maxLogSize);
    config.maxLogFiles = j.value("maxLogFiles", config.maxLogFiles);
    config.console = j.value("console", config.console);
    return config;
}

spdlog::level::level_enum parseLevel(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

bool initializeLogging(const LoggingConfig& config, const std::string& loggerName) {
    if (!config.validate()) {
        std::cerr << "Invalid logging configuration" << std::endl;
        return false;
    }
    try {
        std::vector<spdlog::sink_ptr> sinks;
        if (config.console) {
            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern(kConsolePattern);
            sinks.push_back(consoleSink);
        }
        if (!config.logPath.empty()) {
            const auto parent = std::filesystem::path(config.logPath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.logPath, config.maxLogSize, config.maxLogFiles);
            fileSink->set_pattern(kPattern);
            sinks.push_back(fileSink);
        }
        auto logger = std::make_shared<spdlog::logger>(loggerName, sinks.begin(), sinks.end());
        logger->set_level(parseLevel(config.level));
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        spdlog::debug("Logging system initialized (level {})", config.level);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        return false;
    }
}

} // namespace logging
} // namespace core
} // namespace synapse
