/*
 * plan_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-6

Description: Plan file loading

**************************************************/

#ifndef TESSERA_CONFIG_PLAN_CONFIG_HPP
#define TESSERA_CONFIG_PLAN_CONFIG_HPP

#include <filesystem>
#include <string>

#include "sections/instrument_config.hpp"
#include "sections/logging_config.hpp"
#include "sections/observation_config.hpp"

namespace tessera::config {

/**
 * @brief Everything a planning run reads from its plan file
 *
 * The "observation" section is required; "instrument" and "logging" fall
 * back to their defaults when absent.
 */
struct PlanConfig {
    InstrumentConfig instrument;
    ObservationConfig observation;
    LoggingConfig logging;

    [[nodiscard]] json toJson() const;
};

/**
 * @brief Parse a plan from JSON or JSON5 text
 * @throws InvalidConfiguration if the text or any section is invalid
 */
[[nodiscard]] PlanConfig parsePlanConfig(const std::string& text);

/**
 * @brief Read and parse a plan file
 * @throws InvalidConfiguration if the file cannot be read or is invalid
 */
[[nodiscard]] PlanConfig loadPlanConfig(const std::filesystem::path& path);

}  // namespace tessera::config

#endif  // TESSERA_CONFIG_PLAN_CONFIG_HPP
