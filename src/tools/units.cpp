#include "units.hpp"

#include <cmath>

#include "exception/exception.hpp"
#include "tools/constants.hpp"

namespace tessera::tools {

std::string_view toString(AngularUnit unit) noexcept {
    switch (unit) {
        case AngularUnit::Degrees:
            return "deg";
        case AngularUnit::Radians:
            return "rad";
        case AngularUnit::ArcMinutes:
            return "arcMin";
        case AngularUnit::ArcSeconds:
            return "arcSec";
    }
    return "deg";
}

std::string_view toString(TimeUnit unit) noexcept {
    switch (unit) {
        case TimeUnit::Seconds:
            return "sec";
        case TimeUnit::Minutes:
            return "min";
        case TimeUnit::Hours:
            return "hour";
    }
    return "sec";
}

AngularUnit angularUnitFromString(std::string_view name) {
    if (name == "deg") {
        return AngularUnit::Degrees;
    }
    if (name == "rad") {
        return AngularUnit::Radians;
    }
    if (name == "arcMin") {
        return AngularUnit::ArcMinutes;
    }
    if (name == "arcSec") {
        return AngularUnit::ArcSeconds;
    }
    THROW_INVALID_PARAMETER("Unknown angular unit: ", std::string(name));
}

TimeUnit timeUnitFromString(std::string_view name) {
    if (name == "sec") {
        return TimeUnit::Seconds;
    }
    if (name == "min") {
        return TimeUnit::Minutes;
    }
    if (name == "hour") {
        return TimeUnit::Hours;
    }
    THROW_INVALID_PARAMETER("Unknown time unit: ", std::string(name));
}

double degreesPer(AngularUnit unit) noexcept {
    switch (unit) {
        case AngularUnit::Degrees:
            return 1.0;
        case AngularUnit::Radians:
            return RAD_TO_DEG;
        case AngularUnit::ArcMinutes:
            return 1.0 / ARCMIN_PER_DEG;
        case AngularUnit::ArcSeconds:
            return 1.0 / ARCSEC_PER_DEG;
    }
    return 1.0;
}

double secondsPer(TimeUnit unit) noexcept {
    switch (unit) {
        case TimeUnit::Seconds:
            return 1.0;
        case TimeUnit::Minutes:
            return SECONDS_PER_MINUTE;
        case TimeUnit::Hours:
            return SECONDS_PER_HOUR;
    }
    return 1.0;
}

double convertAngle(double value, AngularUnit from, AngularUnit to) noexcept {
    if (from == to) {
        return value;
    }
    return value * degreesPer(from) / degreesPer(to);
}

double convertTime(double value, TimeUnit from, TimeUnit to) noexcept {
    if (from == to) {
        return value;
    }
    return value * secondsPer(from) / secondsPer(to);
}

std::chrono::nanoseconds toDuration(double value, TimeUnit unit) noexcept {
    const double nanos = value * secondsPer(unit) * 1e9;
    return std::chrono::nanoseconds(static_cast<int64_t>(std::llround(nanos)));
}

}  // namespace tessera::tools
