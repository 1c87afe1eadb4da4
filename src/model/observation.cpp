#include "observation.hpp"

#include "exception/exception.hpp"

namespace tessera::model {

Observation::Observation(ObservationContext context)
    : context_(std::move(context)) {
    if (context_.target.empty()) {
        THROW_INVALID_PARAMETER("Observation target must not be empty");
    }
}

tools::TimePoint Observation::blockEnd(
    std::chrono::nanoseconds leadIn,
    std::chrono::nanoseconds leadOut) const {
    const auto end = context_.startTime + leadIn +
                     tools::toDuration(duration(), context_.timeUnit) + leadOut;
    return tools::truncateToSeconds(end);
}

json Observation::contextJson() const {
    return {{"target", context_.target},
            {"startTime", tools::formatIsoTime(context_.startTime)},
            {"endTime", tools::formatIsoTime(endTime())},
            {"duration", duration()},
            {"timeUnit", std::string(tools::toString(context_.timeUnit))},
            {"angularUnit", std::string(tools::toString(context_.angularUnit))}};
}

}  // namespace tessera::model
