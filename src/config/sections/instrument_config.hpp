/*
 * instrument_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-6

Description: Instrument description used by the observation planner

**************************************************/

#ifndef TESSERA_CONFIG_SECTIONS_INSTRUMENT_CONFIG_HPP
#define TESSERA_CONFIG_SECTIONS_INSTRUMENT_CONFIG_HPP

#include <string>

#include "../config_section.hpp"
#include "tools/constants.hpp"

namespace tessera::config {

/**
 * @brief How an instrument builds up an image
 */
enum class InstrumentKind {
    Framing,  ///< 2-D detector taking whole frames
    Slit      ///< 1-D detector swept across the target
};

[[nodiscard]] inline std::string instrumentKindToString(InstrumentKind kind) {
    return kind == InstrumentKind::Slit ? "slit" : "framing";
}

[[nodiscard]] inline InstrumentKind instrumentKindFromString(const std::string& str) {
    if (str == "framing") return InstrumentKind::Framing;
    if (str == "slit") return InstrumentKind::Slit;
    THROW_INVALID_CONFIGURATION("Unknown instrument kind: ", str);
}

/**
 * @brief Field of view, detector and slew characteristics of an instrument
 *
 * Angles are in degrees, times in seconds, unless the name says otherwise.
 *
 * @example
 * ```json5
 * instrument: {
 *   name: "JANUS",
 *   kind: "framing",
 *   fov: [1.72, 1.29],
 *   resolution: [2000, 1504],
 *   slewRate: 0.025,
 *   filterSwitchTime: 5.0,
 *   bitsPerPixel: 14,
 * }
 * ```
 */
struct InstrumentConfig : ConfigSection<InstrumentConfig> {
    /// Configuration path in the plan file
    static constexpr std::string_view PATH = "instrument";

    std::string name{"JANUS"};
    InstrumentKind kind{InstrumentKind::Framing};

    // ========================================================================
    // Optics and Detector
    // ========================================================================

    double fovWidth{1.72};       ///< deg
    double fovHeight{1.29};      ///< deg
    int resolutionX{2000};       ///< px
    int resolutionY{1504};       ///< px
    int bitsPerPixel{14};

    /// Slit instruments: angular height of one detector line, in radians
    double lineHeight{125e-6};
    /// Slit instruments: data produced per line, in Mbit
    double mbitsPerLine{7.168};

    // ========================================================================
    // Platform
    // ========================================================================

    double slewRate{0.025};          ///< deg/s between pointings
    double filterSwitchTime{5.0};    ///< s

    /// Uncompressed size of one frame, in Mbit
    [[nodiscard]] double mbitsPerImage() const noexcept {
        return static_cast<double>(resolutionX) * resolutionY * bitsPerPixel / 1e6;
    }

    /// Wide-angle framing camera preset
    [[nodiscard]] static InstrumentConfig janus() { return InstrumentConfig{}; }

    /// Imaging spectrometer slit preset
    [[nodiscard]] static InstrumentConfig majis() {
        InstrumentConfig cfg;
        cfg.name = "MAJIS";
        cfg.kind = InstrumentKind::Slit;
        cfg.fovWidth = 3.4;
        cfg.fovHeight = 125e-6 * tools::RAD_TO_DEG;
        cfg.resolutionX = 480;
        cfg.resolutionY = 1;
        cfg.filterSwitchTime = 0.0;
        return cfg;
    }

    [[nodiscard]] json serialize() const {
        return {{"name", name},
                {"kind", instrumentKindToString(kind)},
                {"fov", {fovWidth, fovHeight}},
                {"resolution", {resolutionX, resolutionY}},
                {"bitsPerPixel", bitsPerPixel},
                {"lineHeight", lineHeight},
                {"mbitsPerLine", mbitsPerLine},
                {"slewRate", slewRate},
                {"filterSwitchTime", filterSwitchTime}};
    }

    [[nodiscard]] static InstrumentConfig deserialize(const json& j) {
        InstrumentConfig cfg;
        const auto preset = j.value("preset", std::string{});
        if (preset == "MAJIS") {
            cfg = majis();
        } else if (!preset.empty() && preset != "JANUS") {
            THROW_INVALID_CONFIGURATION("Unknown instrument preset: ", preset);
        }

        cfg.name = j.value("name", cfg.name);
        cfg.kind = instrumentKindFromString(
            j.value("kind", instrumentKindToString(cfg.kind)));
        if (j.contains("fov")) {
            const auto& fov = j.at("fov");
            cfg.fovWidth = fov.at(0).get<double>();
            cfg.fovHeight = fov.at(1).get<double>();
        }
        if (j.contains("resolution")) {
            const auto& resolution = j.at("resolution");
            cfg.resolutionX = resolution.at(0).get<int>();
            cfg.resolutionY = resolution.at(1).get<int>();
        }
        cfg.bitsPerPixel = j.value("bitsPerPixel", cfg.bitsPerPixel);
        cfg.lineHeight = j.value("lineHeight", cfg.lineHeight);
        cfg.mbitsPerLine = j.value("mbitsPerLine", cfg.mbitsPerLine);
        cfg.slewRate = j.value("slewRate", cfg.slewRate);
        cfg.filterSwitchTime = j.value("filterSwitchTime", cfg.filterSwitchTime);

        if (!(cfg.fovWidth > 0.0) || !(cfg.fovHeight > 0.0)) {
            THROW_INVALID_CONFIGURATION("Instrument FOV must be positive");
        }
        if (cfg.resolutionX < 1 || cfg.resolutionY < 1 || cfg.bitsPerPixel < 1) {
            THROW_INVALID_CONFIGURATION("Instrument detector size must be positive");
        }
        if (!(cfg.slewRate > 0.0)) {
            THROW_INVALID_CONFIGURATION("Slew rate must be positive, got ",
                                        cfg.slewRate);
        }
        if (!(cfg.filterSwitchTime >= 0.0)) {
            THROW_INVALID_CONFIGURATION("Filter switch time must be non-negative");
        }
        if (cfg.kind == InstrumentKind::Slit && !(cfg.lineHeight > 0.0)) {
            THROW_INVALID_CONFIGURATION("Slit line height must be positive");
        }
        return cfg;
    }

    [[nodiscard]] static json generateSchema() {
        json schema = {{"type", "object"}};
        addSchemaProperty(schema, "preset", "string", std::string{},
                          "JANUS or MAJIS defaults");
        addSchemaProperty(schema, "name", "string", std::string{"JANUS"});
        addSchemaProperty(schema, "kind", "string", std::string{"framing"});
        addSchemaProperty(schema, "fov", "array", json{1.72, 1.29},
                          "Width and height in degrees");
        addSchemaProperty(schema, "resolution", "array", json{2000, 1504});
        addSchemaProperty(schema, "bitsPerPixel", "integer", 14);
        addSchemaProperty(schema, "lineHeight", "number", 125e-6,
                          "Slit line height in radians");
        addSchemaProperty(schema, "mbitsPerLine", "number", 7.168);
        addSchemaProperty(schema, "slewRate", "number", 0.025, "deg/s");
        addSchemaProperty(schema, "filterSwitchTime", "number", 5.0, "s");
        addRange(schema, "slewRate", 0.0);
        addRange(schema, "filterSwitchTime", 0.0);
        return schema;
    }
};

}  // namespace tessera::config

#endif  // TESSERA_CONFIG_SECTIONS_INSTRUMENT_CONFIG_HPP
