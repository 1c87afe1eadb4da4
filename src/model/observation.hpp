/**
 * @file observation.hpp
 * @brief Common interface of generated mosaics and scans.
 *
 * @date 2024-12-4
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef TESSERA_MODEL_OBSERVATION_HPP
#define TESSERA_MODEL_OBSERVATION_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "geometry/rectangle.hpp"
#include "tools/time.hpp"
#include "tools/units.hpp"

namespace tessera::model {

using json = nlohmann::json;

/**
 * @brief Target, start time and unit system shared by every observation.
 */
struct ObservationContext {
    std::string target;
    tools::TimePoint startTime;
    tools::TimeUnit timeUnit = tools::TimeUnit::Minutes;
    tools::AngularUnit angularUnit = tools::AngularUnit::Degrees;
};

/**
 * @brief A planned observation: an ordered set of pointings with timing.
 *
 * Instances are immutable once constructed. Angles are in the context's
 * angular unit and times in its time unit.
 */
class Observation {
public:
    virtual ~Observation() = default;

    [[nodiscard]] const ObservationContext& context() const noexcept {
        return context_;
    }
    [[nodiscard]] const std::string& target() const noexcept {
        return context_.target;
    }
    [[nodiscard]] const tools::TimePoint& startTime() const noexcept {
        return context_.startTime;
    }
    [[nodiscard]] tools::TimeUnit timeUnit() const noexcept {
        return context_.timeUnit;
    }
    [[nodiscard]] tools::AngularUnit angularUnit() const noexcept {
        return context_.angularUnit;
    }

    /// Time spent pointing and slewing, excluding fixed pre/post margins
    [[nodiscard]] virtual double duration() const = 0;

    /// End of the observation block, truncated to whole seconds
    [[nodiscard]] virtual tools::TimePoint endTime() const = 0;

    /// Pointing centers in visiting order
    [[nodiscard]] virtual std::vector<geometry::Point> centerPoints() const = 0;

    /// Footprint of every pointing, for display
    [[nodiscard]] virtual std::vector<geometry::Rectangle> rectangles() const = 0;

    [[nodiscard]] virtual json toJson() const = 0;

protected:
    /**
     * @throws InvalidParameter if the target name is empty
     */
    explicit Observation(ObservationContext context);

    /// Start time plus lead-in, duration and lead-out, truncated to seconds
    [[nodiscard]] tools::TimePoint blockEnd(
        std::chrono::nanoseconds leadIn,
        std::chrono::nanoseconds leadOut) const;

    /// Fields every observation serializes
    [[nodiscard]] json contextJson() const;

private:
    ObservationContext context_;
};

}  // namespace tessera::model

#endif  // TESSERA_MODEL_OBSERVATION_HPP
