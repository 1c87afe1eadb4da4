/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-6

Description: Logging configuration section of a plan file

**************************************************/

#ifndef TESSERA_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define TESSERA_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <string>

#include "../config_section.hpp"

namespace tessera::config {

/**
 * @brief Log level enumeration
 */
enum class LogLevel { Trace, Debug, Info, Warn, Error, Critical, Off };

/**
 * @brief Convert LogLevel to string
 */
[[nodiscard]] inline std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

/**
 * @brief Convert string to LogLevel
 * @throws InvalidConfiguration for an unknown level name
 */
[[nodiscard]] inline LogLevel logLevelFromString(const std::string& str) {
    if (str == "trace") return LogLevel::Trace;
    if (str == "debug") return LogLevel::Debug;
    if (str == "info") return LogLevel::Info;
    if (str == "warn" || str == "warning") return LogLevel::Warn;
    if (str == "error" || str == "err") return LogLevel::Error;
    if (str == "critical" || str == "fatal") return LogLevel::Critical;
    if (str == "off" || str == "none") return LogLevel::Off;
    THROW_INVALID_CONFIGURATION("Unknown log level: ", str);
}

/**
 * @brief Console and file logging of a planning run
 *
 * @example
 * ```json5
 * logging: {
 *   consoleLevel: "info",
 *   enableFile: true,
 *   logDir: "logs",
 *   fileLevel: "debug",
 * }
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    /// Configuration path in the plan file
    static constexpr std::string_view PATH = "logging";

    // ========================================================================
    // Console Settings
    // ========================================================================

    bool enableConsole{true};            ///< Enable console output
    LogLevel consoleLevel{LogLevel::Info};  ///< Console log level
    bool consoleColor{true};             ///< Enable ANSI color codes

    // ========================================================================
    // File Settings
    // ========================================================================

    bool enableFile{false};              ///< Enable file output
    std::string logDir{"logs"};          ///< Log directory path
    std::string logFilename{"tessera"};  ///< Base filename (without extension)
    LogLevel fileLevel{LogLevel::Debug};  ///< File log level

    // ========================================================================
    // Format Settings
    // ========================================================================

    /// Default log pattern
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"};

    [[nodiscard]] json serialize() const {
        return {{"enableConsole", enableConsole},
                {"consoleLevel", logLevelToString(consoleLevel)},
                {"consoleColor", consoleColor},
                {"enableFile", enableFile},
                {"logDir", logDir},
                {"logFilename", logFilename},
                {"fileLevel", logLevelToString(fileLevel)},
                {"pattern", pattern}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;
        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.consoleLevel = logLevelFromString(
            j.value("consoleLevel", logLevelToString(cfg.consoleLevel)));
        cfg.consoleColor = j.value("consoleColor", cfg.consoleColor);
        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.logDir = j.value("logDir", cfg.logDir);
        cfg.logFilename = j.value("logFilename", cfg.logFilename);
        cfg.fileLevel = logLevelFromString(
            j.value("fileLevel", logLevelToString(cfg.fileLevel)));
        cfg.pattern = j.value("pattern", cfg.pattern);
        if (cfg.enableFile && cfg.logFilename.empty()) {
            THROW_INVALID_CONFIGURATION("logFilename must not be empty");
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        const json levels = {"trace", "debug", "info", "warn",
                             "error", "critical", "off"};
        return {{"type", "object"},
                {"properties",
                 {{"enableConsole", {{"type", "boolean"}, {"default", true}}},
                  {"consoleLevel",
                   {{"type", "string"}, {"enum", levels}, {"default", "info"}}},
                  {"consoleColor", {{"type", "boolean"}, {"default", true}}},
                  {"enableFile", {{"type", "boolean"}, {"default", false}}},
                  {"logDir", {{"type", "string"}, {"default", "logs"}}},
                  {"logFilename", {{"type", "string"}, {"default", "tessera"}}},
                  {"fileLevel",
                   {{"type", "string"}, {"enum", levels}, {"default", "debug"}}},
                  {"pattern", {{"type", "string"}}}}}};
    }
};

}  // namespace tessera::config

#endif  // TESSERA_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
