/**
 * @file observation_planner.hpp
 * @brief Instrument-aware planning of mosaics and scans.
 *
 * @date 2024-12-7
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_PLANNER_OBSERVATION_PLANNER_HPP
#define TESSERA_PLANNER_OBSERVATION_PLANNER_HPP

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "config/sections/instrument_config.hpp"
#include "config/sections/observation_config.hpp"
#include "ephemeris/celestial_geometry.hpp"
#include "model/observation.hpp"

namespace tessera::planner {

using json = nlohmann::json;

/**
 * @brief Resource and convergence figures of a planned observation.
 */
struct PlanReport {
    std::string instrument;
    std::string target;
    config::ObservationMode mode{config::ObservationMode::Mosaic};
    bool sunside{false};

    tools::TimePoint startTime{};
    tools::TimePoint endTime{};
    double durationSeconds{0.0};  ///< End minus start, margins included

    size_t positions{0};   ///< Frame centers or scan lines
    size_t imageCount{0};  ///< Positions times filters; lines for scans
    double dataVolume{0.0};       ///< Uncompressed, Mbit
    double averageDataRate{0.0};  ///< Uncompressed, kbit/s

    double exposureTime{0.0};       ///< s, as used
    double smearLimitedExposure{0.0};  ///< s, shortest smear limit seen
    double dwellTime{0.0};          ///< s, mosaics only

    int iterations{0};
    bool converged{true};
    double growthFactor{1.0};    ///< Diameter at end over diameter at start
    double requestedMargin{0.0};
    double usedMargin{0.0};
    double realMargin{0.0};      ///< Margin left after growth

    [[nodiscard]] json toJson() const;

    /// Multi-line human-readable report
    [[nodiscard]] std::string summary() const;
};

/**
 * @brief A planned observation with its report and PTR block.
 */
struct PlanResult {
    std::shared_ptr<const model::Observation> observation;
    PlanReport report;
    std::string ptr;
};

/**
 * @class ObservationPlanner
 * @brief Turns observation requests into mosaics or scans for one instrument.
 *
 * Framing mosaics are planned iteratively: the target grows while the
 * mosaic is taken, and the mosaic takes longer the larger the target is.
 * Starting from a one-minute guess, each iteration sizes the margin for the
 * growth over the previous duration estimate, limits the exposure so smear
 * stays below the requested number of pixels, and regenerates the mosaic.
 * The loop stops once the duration no longer changes.
 *
 * Slit scans are generated once, with the scan rate set so that one line
 * height passes during one exposure.
 */
class ObservationPlanner {
public:
    /**
     * @throws InvalidParameter if geometry is null
     */
    ObservationPlanner(std::shared_ptr<const ephemeris::CelestialGeometry> geometry,
                       config::InstrumentConfig instrument);

    [[nodiscard]] const config::InstrumentConfig& instrument() const noexcept {
        return instrument_;
    }

    /**
     * @brief Time spent at one mosaic position, in seconds.
     *
     * Stabilization, one exposure per filter and a filter switch between
     * consecutive filters.
     */
    [[nodiscard]] double dwellTime(double exposureTime, int filters,
                                   double stabilizationTime) const;

    /**
     * @brief Longest exposure whose smear stays within maxSmear pixels.
     * @return Exposure time in seconds
     * @throws GeometryUnavailable if the geometry cannot be evaluated
     */
    [[nodiscard]] double maxExposureForSmear(const std::string& observer,
                                             const std::string& target,
                                             const tools::TimePoint& time,
                                             double maxSmear) const;

    /**
     * @brief Smallest smear limit over a window starting at the request's
     * start time.
     *
     * Sampled at every whole minute of the window and at its end.
     */
    [[nodiscard]] double smearLimitedExposure(
        const config::ObservationConfig& request,
        std::chrono::seconds window) const;

    /**
     * @brief Plan a mosaic or a scan, depending on the request mode.
     * @throws InvalidParameter if the mode does not suit the instrument
     * @throws GeometryUnavailable if the geometry cannot be evaluated
     */
    [[nodiscard]] PlanResult plan(const config::ObservationConfig& request) const;

private:
    [[nodiscard]] PlanResult planMosaic(
        const config::ObservationConfig& request) const;
    [[nodiscard]] PlanResult planScan(
        const config::ObservationConfig& request) const;

    /// Diameter at a time over diameter at the request's start time
    [[nodiscard]] double growthFactor(const config::ObservationConfig& request,
                                      const tools::TimePoint& time) const;

    [[nodiscard]] model::ObservationContext contextFor(
        const config::ObservationConfig& request) const;

    /// Instrument slew rate in the request's angle per time unit
    [[nodiscard]] double slewRateFor(
        const config::ObservationConfig& request) const;

    std::shared_ptr<const ephemeris::CelestialGeometry> geometry_;
    config::InstrumentConfig instrument_;
};

}  // namespace tessera::planner

#endif  // TESSERA_PLANNER_OBSERVATION_PLANNER_HPP
