/*
 * observation_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-6

Description: Observation request section of a plan file

**************************************************/

#ifndef TESSERA_CONFIG_SECTIONS_OBSERVATION_CONFIG_HPP
#define TESSERA_CONFIG_SECTIONS_OBSERVATION_CONFIG_HPP

#include <string>

#include "../config_section.hpp"
#include "tools/time.hpp"
#include "tools/units.hpp"

namespace tessera::config {

/**
 * @brief Kind of observation to plan
 */
enum class ObservationMode {
    Mosaic,  ///< Framing-camera mosaic
    Scan     ///< Slit-instrument scan
};

[[nodiscard]] inline std::string observationModeToString(ObservationMode mode) {
    return mode == ObservationMode::Scan ? "scan" : "mosaic";
}

[[nodiscard]] inline ObservationMode observationModeFromString(
    const std::string& str) {
    if (str == "mosaic") return ObservationMode::Mosaic;
    if (str == "scan") return ObservationMode::Scan;
    THROW_INVALID_CONFIGURATION("Unknown observation mode: ", str);
}

/**
 * @brief One observation request: target, timing and coverage settings
 *
 * Exposure, stabilization and other instrument times are in seconds
 * whatever the configured time unit; the units only affect the generated
 * observation and its PTR block.
 *
 * @example
 * ```json5
 * observation: {
 *   target: "CALLISTO",
 *   startTime: "2031-04-26T00:40:47",
 *   mode: "mosaic",
 *   sunside: false,
 *   exposureTime: 15,   // upper bound, smear may lower it
 *   filters: 4,
 *   maxSmear: 0.25,
 * }
 * ```
 */
struct ObservationConfig : ConfigSection<ObservationConfig> {
    /// Configuration path in the plan file
    static constexpr std::string_view PATH = "observation";

    std::string observer{"JUICE"};
    std::string target;
    tools::TimePoint startTime{};
    ObservationMode mode{ObservationMode::Mosaic};
    bool sunside{false};

    // ========================================================================
    // Exposure
    // ========================================================================

    /// Mosaics: longest allowed exposure. Scans: exposure of one line.
    double exposureTime{15.0};
    int filters{4};
    double stabilizationTime{5.0};
    /// Largest tolerated image smear over one exposure, in pixels
    double maxSmear{0.25};

    // ========================================================================
    // Coverage
    // ========================================================================

    /// Scans: margin around the disk, as a fraction of the diameter
    double margin{0.05};
    /// Mosaics: margin added on top of the growth of the target
    double extraMargin{0.05};
    double overlap{0.1};
    int maxIterations{30};
    int tourPasses{10};

    // ========================================================================
    // Output
    // ========================================================================

    tools::TimeUnit timeUnit{tools::TimeUnit::Minutes};
    tools::AngularUnit angularUnit{tools::AngularUnit::Degrees};
    int decimals{3};

    [[nodiscard]] json serialize() const {
        return {{"observer", observer},
                {"target", target},
                {"startTime", tools::formatIsoTime(startTime)},
                {"mode", observationModeToString(mode)},
                {"sunside", sunside},
                {"exposureTime", exposureTime},
                {"filters", filters},
                {"stabilizationTime", stabilizationTime},
                {"maxSmear", maxSmear},
                {"margin", margin},
                {"extraMargin", extraMargin},
                {"overlap", overlap},
                {"maxIterations", maxIterations},
                {"tourPasses", tourPasses},
                {"timeUnit", std::string(tools::toString(timeUnit))},
                {"angularUnit", std::string(tools::toString(angularUnit))},
                {"decimals", decimals}};
    }

    [[nodiscard]] static ObservationConfig deserialize(const json& j) {
        ObservationConfig cfg;
        cfg.observer = j.value("observer", cfg.observer);
        cfg.target = j.at("target").get<std::string>();
        cfg.mode = observationModeFromString(
            j.value("mode", observationModeToString(cfg.mode)));
        cfg.sunside = j.value("sunside", cfg.sunside);
        cfg.exposureTime = j.value("exposureTime", cfg.exposureTime);
        cfg.filters = j.value("filters", cfg.filters);
        cfg.stabilizationTime = j.value("stabilizationTime", cfg.stabilizationTime);
        cfg.maxSmear = j.value("maxSmear", cfg.maxSmear);
        cfg.margin = j.value("margin", cfg.margin);
        cfg.extraMargin = j.value("extraMargin", cfg.extraMargin);
        cfg.overlap = j.value("overlap", cfg.overlap);
        cfg.maxIterations = j.value("maxIterations", cfg.maxIterations);
        cfg.tourPasses = j.value("tourPasses", cfg.tourPasses);
        cfg.decimals = j.value("decimals", cfg.decimals);

        try {
            cfg.startTime =
                tools::parseIsoTime(j.at("startTime").get<std::string>());
            cfg.timeUnit = tools::timeUnitFromString(
                j.value("timeUnit", std::string(tools::toString(cfg.timeUnit))));
            cfg.angularUnit = tools::angularUnitFromString(j.value(
                "angularUnit", std::string(tools::toString(cfg.angularUnit))));
        } catch (const InvalidParameter& e) {
            THROW_INVALID_CONFIGURATION("Observation: ", e.what());
        }

        if (cfg.target.empty()) {
            THROW_INVALID_CONFIGURATION("Observation target must not be empty");
        }
        if (!(cfg.exposureTime > 0.0)) {
            THROW_INVALID_CONFIGURATION("Exposure time must be positive, got ",
                                        cfg.exposureTime);
        }
        if (cfg.filters < 1) {
            THROW_INVALID_CONFIGURATION("At least one filter is required");
        }
        if (!(cfg.stabilizationTime >= 0.0)) {
            THROW_INVALID_CONFIGURATION("Stabilization time must be non-negative");
        }
        if (!(cfg.maxSmear > 0.0)) {
            THROW_INVALID_CONFIGURATION("Max smear must be positive, got ",
                                        cfg.maxSmear);
        }
        if (!(cfg.margin > -1.0) || !(cfg.extraMargin > -1.0)) {
            THROW_INVALID_CONFIGURATION("Margins must be greater than -1");
        }
        if (!(cfg.overlap >= 0.0 && cfg.overlap < 1.0)) {
            THROW_INVALID_CONFIGURATION("Overlap must be in [0, 1), got ",
                                        cfg.overlap);
        }
        if (cfg.maxIterations < 1) {
            THROW_INVALID_CONFIGURATION("maxIterations must be at least 1");
        }
        if (cfg.tourPasses < 0) {
            THROW_INVALID_CONFIGURATION("tourPasses must be non-negative");
        }
        if (cfg.decimals < 0 || cfg.decimals > 12) {
            THROW_INVALID_CONFIGURATION("decimals must be in [0, 12], got ",
                                        cfg.decimals);
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {{"type", "object"},
                       {"required", json::array({"target", "startTime"})}};
        addSchemaProperty(schema, "observer", "string", std::string{"JUICE"});
        addSchemaProperty(schema, "target", "string", std::string{});
        addSchemaProperty(schema, "startTime", "string", std::string{},
                          "UTC, YYYY-MM-DDTHH:MM:SS");
        addSchemaProperty(schema, "mode", "string", std::string{"mosaic"});
        addSchemaProperty(schema, "sunside", "boolean", false);
        addSchemaProperty(schema, "exposureTime", "number", 15.0, "s");
        addSchemaProperty(schema, "filters", "integer", 4);
        addSchemaProperty(schema, "stabilizationTime", "number", 5.0, "s");
        addSchemaProperty(schema, "maxSmear", "number", 0.25, "px");
        addSchemaProperty(schema, "margin", "number", 0.05);
        addSchemaProperty(schema, "extraMargin", "number", 0.05);
        addSchemaProperty(schema, "overlap", "number", 0.1);
        addSchemaProperty(schema, "maxIterations", "integer", 30);
        addSchemaProperty(schema, "tourPasses", "integer", 10);
        addSchemaProperty(schema, "timeUnit", "string", std::string{"min"});
        addSchemaProperty(schema, "angularUnit", "string", std::string{"deg"});
        addSchemaProperty(schema, "decimals", "integer", 3);
        addRange(schema, "overlap", 0.0, 1.0);
        addRange(schema, "filters", 1.0);
        addRange(schema, "decimals", 0.0, 12.0);
        return schema;
    }
};

}  // namespace tessera::config

#endif  // TESSERA_CONFIG_SECTIONS_OBSERVATION_CONFIG_HPP
