/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-7

Description: spdlog setup for planning runs

**************************************************/

#ifndef TESSERA_LOGGING_LOGGING_HPP
#define TESSERA_LOGGING_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace tessera::logging {

/// Name of the logger installed as spdlog's default
inline constexpr const char* DEFAULT_LOGGER_NAME = "tessera";

[[nodiscard]] spdlog::level::level_enum toSpdlogLevel(config::LogLevel level);

/**
 * @brief Create a stdout sink, colored or plain.
 */
[[nodiscard]] spdlog::sink_ptr createConsoleSink(spdlog::level::level_enum level,
                                                 const std::string& pattern,
                                                 bool color);

/**
 * @brief Create a file sink, creating parent directories as needed.
 * @throws spdlog::spdlog_ex if the file cannot be opened
 */
[[nodiscard]] spdlog::sink_ptr createFileSink(const std::string& filePath,
                                              spdlog::level::level_enum level,
                                              const std::string& pattern);

/**
 * @brief Build the configured sinks and install them as the default logger.
 *
 * With every sink disabled the default logger has no sinks and drops all
 * messages.
 *
 * @return The installed logger
 * @throws InvalidConfiguration if the log file cannot be created
 */
std::shared_ptr<spdlog::logger> setupLogging(const config::LoggingConfig& config);

}  // namespace tessera::logging

#endif  // TESSERA_LOGGING_LOGGING_HPP
