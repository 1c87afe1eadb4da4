#include "logging.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include "exception/exception.hpp"

namespace tessera::logging {

spdlog::level::level_enum toSpdlogLevel(config::LogLevel level) {
    switch (level) {
        case config::LogLevel::Trace: return spdlog::level::trace;
        case config::LogLevel::Debug: return spdlog::level::debug;
        case config::LogLevel::Info: return spdlog::level::info;
        case config::LogLevel::Warn: return spdlog::level::warn;
        case config::LogLevel::Error: return spdlog::level::err;
        case config::LogLevel::Critical: return spdlog::level::critical;
        case config::LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

spdlog::sink_ptr createConsoleSink(spdlog::level::level_enum level,
                                   const std::string& pattern, bool color) {
    spdlog::sink_ptr sink;
    if (color) {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

spdlog::sink_ptr createFileSink(const std::string& filePath,
                                spdlog::level::level_enum level,
                                const std::string& pattern) {
    std::filesystem::path path(filePath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filePath);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

std::shared_ptr<spdlog::logger> setupLogging(
    const config::LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    auto level = spdlog::level::off;

    if (config.enableConsole) {
        const auto consoleLevel = toSpdlogLevel(config.consoleLevel);
        sinks.push_back(
            createConsoleSink(consoleLevel, config.pattern, config.consoleColor));
        level = std::min(level, consoleLevel);
    }

    std::string filePath;
    if (config.enableFile) {
        filePath = (std::filesystem::path(config.logDir) /
                    (config.logFilename + ".log"))
                       .string();
        const auto fileLevel = toSpdlogLevel(config.fileLevel);
        try {
            sinks.push_back(createFileSink(filePath, fileLevel, config.pattern));
        } catch (const spdlog::spdlog_ex& e) {
            THROW_INVALID_CONFIGURATION("Cannot open log file ", filePath, ": ",
                                        e.what());
        } catch (const std::filesystem::filesystem_error& e) {
            THROW_INVALID_CONFIGURATION("Cannot create log directory ",
                                        config.logDir, ": ", e.what());
        }
        level = std::min(level, fileLevel);
    }

    auto logger = std::make_shared<spdlog::logger>(DEFAULT_LOGGER_NAME,
                                                   sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!filePath.empty()) {
        spdlog::debug("Logging to {}", filePath);
    }
    return logger;
}

}  // namespace tessera::logging
