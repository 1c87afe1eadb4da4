#include "observation_planner.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "generator/mosaic_generator.hpp"
#include "generator/scan_generator.hpp"
#include "ptr/ptr_writer.hpp"
#include "tools/constants.hpp"

namespace tessera::planner {

namespace {

constexpr std::chrono::seconds INITIAL_DURATION_GUESS{60};

double minutesOf(std::chrono::seconds duration) {
    return static_cast<double>(duration.count()) / tools::SECONDS_PER_MINUTE;
}

std::string formatDuration(double seconds) {
    const auto total = static_cast<long long>(std::llround(seconds));
    return fmt::format("{}:{:02}:{:02}", total / 3600, (total / 60) % 60,
                       total % 60);
}

/// Warn when the target outgrows the planned margin during the observation
void checkMargin(const PlanReport& report) {
    if (report.realMargin < 0.0) {
        spdlog::warn(
            "Margin {:.1f}% is too small: {} grows by {:.1f}% during the "
            "observation",
            report.usedMargin * 100.0, report.target,
            (report.growthFactor - 1.0) * 100.0);
    }
}

}  // namespace

// ============================================================================
// PlanReport
// ============================================================================

json PlanReport::toJson() const {
    return {{"instrument", instrument},
            {"target", target},
            {"mode", config::observationModeToString(mode)},
            {"sunside", sunside},
            {"startTime", tools::formatIsoTime(startTime)},
            {"endTime", tools::formatIsoTime(endTime)},
            {"durationSeconds", durationSeconds},
            {"positions", positions},
            {"imageCount", imageCount},
            {"dataVolumeMbit", dataVolume},
            {"averageDataRateKbitPerSec", averageDataRate},
            {"exposureTime", exposureTime},
            {"smearLimitedExposure", smearLimitedExposure},
            {"dwellTime", dwellTime},
            {"iterations", iterations},
            {"converged", converged},
            {"growthFactor", growthFactor},
            {"requestedMargin", requestedMargin},
            {"usedMargin", usedMargin},
            {"realMargin", realMargin}};
}

std::string PlanReport::summary() const {
    const bool isScan = mode == config::ObservationMode::Scan;
    std::string out = fmt::format("{} {} REPORT:\n", instrument,
                                  isScan ? "SCAN" : "MOSAIC");
    auto it = std::back_inserter(out);
    fmt::format_to(it, " Type: {}\n", sunside ? "Sunside" : "Full disk");
    fmt::format_to(it, " Target: {}\n", target);
    fmt::format_to(it, " Start time: {}\n", tools::formatIsoTime(startTime));
    fmt::format_to(it, " End time:   {}\n", tools::formatIsoTime(endTime));
    fmt::format_to(it, " Duration: {}\n", formatDuration(durationSeconds));
    if (isScan) {
        fmt::format_to(it, " Number of scan lines: {}\n", positions);
        fmt::format_to(it, " Line exposure time: {:.3f} s\n", exposureTime);
    } else {
        fmt::format_to(it, " Total number of images: {} ({} positions)\n",
                       imageCount, positions);
        fmt::format_to(it, " Smear-limited exposure time: {:.3f} s\n",
                       smearLimitedExposure);
        fmt::format_to(it, " Used exposure time: {:.3f} s\n", exposureTime);
        fmt::format_to(it, " Used dwell time: {:.3f} s\n", dwellTime);
        fmt::format_to(it, " Iterations: {}{}\n", iterations,
                       converged ? "" : " (not converged)");
    }
    fmt::format_to(it, " Uncompressed data volume: {:.3f} Mbits\n", dataVolume);
    fmt::format_to(it, " Uncompressed average data rate: {:.3f} kbits/s\n",
                   averageDataRate);
    fmt::format_to(it, " Requested margin: {:.3f} %\n", requestedMargin * 100.0);
    fmt::format_to(it, " Real margin:      {:.3f} %\n", realMargin * 100.0);
    fmt::format_to(it, " Growth factor:    {:.3f}\n", growthFactor);
    return out;
}

// ============================================================================
// ObservationPlanner
// ============================================================================

ObservationPlanner::ObservationPlanner(
    std::shared_ptr<const ephemeris::CelestialGeometry> geometry,
    config::InstrumentConfig instrument)
    : geometry_(std::move(geometry)), instrument_(std::move(instrument)) {
    if (!geometry_) {
        THROW_INVALID_PARAMETER("Observation planner needs a geometry source");
    }
}

double ObservationPlanner::dwellTime(double exposureTime, int filters,
                                     double stabilizationTime) const {
    if (!(exposureTime > 0.0)) {
        THROW_INVALID_PARAMETER("Exposure time must be positive, got ",
                                exposureTime);
    }
    if (filters < 1) {
        THROW_INVALID_PARAMETER("At least one filter is required, got ", filters);
    }
    if (!(stabilizationTime >= 0.0)) {
        THROW_INVALID_PARAMETER("Stabilization time must be non-negative, got ",
                                stabilizationTime);
    }
    return stabilizationTime + exposureTime * filters +
           instrument_.filterSwitchTime * (filters - 1);
}

double ObservationPlanner::maxExposureForSmear(const std::string& observer,
                                               const std::string& target,
                                               const tools::TimePoint& time,
                                               double maxSmear) const {
    if (!(maxSmear > 0.0)) {
        THROW_INVALID_PARAMETER("Max smear must be positive, got ", maxSmear);
    }
    const double footprint = geometry_->pixelFootprint(
        observer, target, time, instrument_.fovWidth, instrument_.resolutionX);
    const double velocity =
        geometry_->nadirSurfaceVelocity(observer, target, time);
    if (!(velocity > 0.0)) {
        THROW_GEOMETRY_UNAVAILABLE("Nadir velocity over ", target,
                                   " must be positive, got ", velocity);
    }
    return footprint * maxSmear / velocity;
}

double ObservationPlanner::smearLimitedExposure(
    const config::ObservationConfig& request,
    std::chrono::seconds window) const {
    double limit =
        maxExposureForSmear(request.observer, request.target,
                            request.startTime + window, request.maxSmear);
    const auto wholeMinutes =
        std::chrono::duration_cast<std::chrono::minutes>(window).count();
    for (std::chrono::minutes::rep m = 0; m < wholeMinutes; ++m) {
        limit = std::min(limit, maxExposureForSmear(
                                    request.observer, request.target,
                                    request.startTime + std::chrono::minutes(m),
                                    request.maxSmear));
    }
    return limit;
}

double ObservationPlanner::growthFactor(const config::ObservationConfig& request,
                                        const tools::TimePoint& time) const {
    const double start = geometry_->angularDiameter(
        request.observer, request.target, request.startTime);
    if (!(start > 0.0)) {
        THROW_GEOMETRY_UNAVAILABLE("Angular diameter of ", request.target,
                                   " must be positive");
    }
    return geometry_->angularDiameter(request.observer, request.target, time) /
           start;
}

model::ObservationContext ObservationPlanner::contextFor(
    const config::ObservationConfig& request) const {
    return {request.target, request.startTime, request.timeUnit,
            request.angularUnit};
}

double ObservationPlanner::slewRateFor(
    const config::ObservationConfig& request) const {
    return tools::convertAngle(instrument_.slewRate, tools::AngularUnit::Degrees,
                               request.angularUnit) *
           tools::secondsPer(request.timeUnit);
}

PlanResult ObservationPlanner::plan(
    const config::ObservationConfig& request) const {
    const bool slit = instrument_.kind == config::InstrumentKind::Slit;
    if (request.mode == config::ObservationMode::Mosaic && slit) {
        THROW_INVALID_PARAMETER("Slit instrument ", instrument_.name,
                                " cannot take mosaics");
    }
    if (request.mode == config::ObservationMode::Scan && !slit) {
        THROW_INVALID_PARAMETER("Framing instrument ", instrument_.name,
                                " cannot take scans");
    }

    spdlog::info("Planning {} {} of {} with {} from {}",
                 request.sunside ? "sunside" : "full-disk",
                 config::observationModeToString(request.mode), request.target,
                 instrument_.name, tools::formatIsoTime(request.startTime));
    return slit ? planScan(request) : planMosaic(request);
}

PlanResult ObservationPlanner::planMosaic(
    const config::ObservationConfig& request) const {
    const auto context = contextFor(request);
    const auto angle = tools::AngularUnit::Degrees;

    generator::MosaicSettings settings;
    settings.observer = request.observer;
    settings.fovSize = {
        tools::convertAngle(instrument_.fovWidth, angle, request.angularUnit),
        tools::convertAngle(instrument_.fovHeight, angle, request.angularUnit)};
    settings.slewRate = slewRateFor(request);

    if (request.maxIterations < 1) {
        THROW_INVALID_PARAMETER("At least one iteration is required, got ",
                                request.maxIterations);
    }

    PlanReport report;
    report.converged = false;
    std::shared_ptr<const model::Observation> observation;
    std::chrono::seconds guess = INITIAL_DURATION_GUESS;
    tools::TimePoint intervalEnd = request.startTime + guess;

    while (report.iterations < request.maxIterations) {
        ++report.iterations;
        const double ratio = growthFactor(request, intervalEnd);
        report.usedMargin = std::max(ratio - 1.0, 0.0) + request.extraMargin;
        report.exposureTime =
            std::min(request.exposureTime, smearLimitedExposure(request, guess));
        report.dwellTime = dwellTime(report.exposureTime, request.filters,
                                     request.stabilizationTime);
        settings.dwellTime = tools::convertTime(
            report.dwellTime, tools::TimeUnit::Seconds, request.timeUnit);

        const generator::MosaicGenerator generator(geometry_, context, settings);
        if (request.sunside) {
            observation = std::make_shared<const model::CustomMosaic>(
                generator.generateSunsideMosaic(report.usedMargin,
                                                request.overlap,
                                                request.tourPasses));
        } else {
            observation = std::make_shared<const model::RasterMosaic>(
                generator.generateSymmetricMosaic(report.usedMargin,
                                                  request.overlap));
        }

        intervalEnd = observation->endTime();
        const auto duration = std::chrono::duration_cast<std::chrono::seconds>(
            intervalEnd - observation->startTime());
        spdlog::info(
            "Iteration {}/{}: growth {:.4f}, margin {:.3f}, exposure {:.3f} s, "
            "duration {:.3f} -> {:.3f} min",
            report.iterations, request.maxIterations, ratio, report.usedMargin,
            report.exposureTime, minutesOf(guess), minutesOf(duration));
        if (duration == guess) {
            report.converged = true;
            break;
        }
        guess = duration;
    }
    if (!report.converged) {
        spdlog::warn("Mosaic duration did not settle after {} iterations",
                     report.iterations);
    }

    report.instrument = instrument_.name;
    report.target = request.target;
    report.mode = request.mode;
    report.sunside = request.sunside;
    report.startTime = observation->startTime();
    report.endTime = observation->endTime();
    report.durationSeconds = std::chrono::duration<double>(
                                 report.endTime - report.startTime)
                                 .count();
    report.positions = observation->centerPoints().size();
    report.imageCount = report.positions * static_cast<size_t>(request.filters);
    report.dataVolume =
        static_cast<double>(report.imageCount) * instrument_.mbitsPerImage();
    report.averageDataRate = report.dataVolume * 1000.0 / report.durationSeconds;
    report.smearLimitedExposure = smearLimitedExposure(
        request, std::chrono::duration_cast<std::chrono::seconds>(
                     report.endTime - report.startTime));
    report.growthFactor = growthFactor(request, report.endTime);
    report.requestedMargin = request.extraMargin;
    report.realMargin =
        report.usedMargin + 1.0 - std::max(report.growthFactor, 1.0);
    checkMargin(report);

    spdlog::info("Planned mosaic of {}: {} positions, {:.3f} Mbit over {}",
                 report.target, report.positions, report.dataVolume,
                 formatDuration(report.durationSeconds));
    return {observation, report,
            ptr::PtrWriter(request.decimals).write(*observation)};
}

PlanResult ObservationPlanner::planScan(
    const config::ObservationConfig& request) const {
    const auto context = contextFor(request);

    generator::ScanSettings settings;
    settings.observer = request.observer;
    settings.fovWidth = tools::convertAngle(
        instrument_.fovWidth, tools::AngularUnit::Degrees, request.angularUnit);
    const double lineHeight = tools::convertAngle(
        instrument_.lineHeight, tools::AngularUnit::Radians, request.angularUnit);
    settings.scanSlewRate =
        lineHeight / tools::convertTime(request.exposureTime,
                                        tools::TimeUnit::Seconds,
                                        request.timeUnit);
    settings.transferSlewRate = slewRateFor(request);

    const generator::ScanGenerator generator(geometry_, context, settings);
    auto scan = std::make_shared<const model::Scan>(
        request.sunside
            ? generator.generateSunsideScan(request.margin, request.overlap)
            : generator.generateSymmetricScan(request.margin, request.overlap));

    double scannedLength = 0.0;
    for (const auto& line : scan->rectangles()) {
        scannedLength += line.size().height;
    }
    const double detectorLines = scannedLength / lineHeight;

    PlanReport report;
    report.instrument = instrument_.name;
    report.target = request.target;
    report.mode = request.mode;
    report.sunside = request.sunside;
    report.startTime = scan->startTime();
    report.endTime = scan->endTime();
    report.durationSeconds = std::chrono::duration<double>(
                                 report.endTime - report.startTime)
                                 .count();
    report.positions = static_cast<size_t>(scan->numberOfLines());
    report.imageCount = static_cast<size_t>(std::llround(detectorLines));
    report.dataVolume = detectorLines * instrument_.mbitsPerLine;
    report.averageDataRate = report.dataVolume * 1000.0 / report.durationSeconds;
    report.exposureTime = request.exposureTime;
    report.iterations = 1;
    report.growthFactor = growthFactor(request, report.endTime);
    report.requestedMargin = request.margin;
    report.usedMargin = request.margin;
    report.realMargin =
        report.usedMargin + 1.0 - std::max(report.growthFactor, 1.0);
    checkMargin(report);

    spdlog::info("Planned scan of {}: {} lines at {:.4f} {}/{}, {:.3f} Mbit",
                 report.target, report.positions, settings.scanSlewRate,
                 tools::toString(request.angularUnit),
                 tools::toString(request.timeUnit), report.dataVolume);
    return {scan, report, ptr::PtrWriter(request.decimals).write(*scan)};
}

}  // namespace tessera::planner
