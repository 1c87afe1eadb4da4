#include "plan_config.hpp"

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "json5.hpp"

namespace tessera::config {

namespace {

/// Replaces `section` with the plan's entry under T::PATH, if there is one
template <ConfigSectionDerived T>
bool readSection(const json& root, T& section) {
    const auto it = root.find(std::string(T::path()));
    if (it == root.end()) {
        return false;
    }
    section = T::fromJson(*it);
    return true;
}

}  // namespace

json PlanConfig::toJson() const {
    return {{std::string(InstrumentConfig::path()), instrument.toJson()},
            {std::string(ObservationConfig::path()), observation.toJson()},
            {std::string(LoggingConfig::path()), logging.toJson()}};
}

PlanConfig parsePlanConfig(const std::string& text) {
    json root;
    try {
        root = json::parse(internal::convertJSON5toJSON(text));
    } catch (const json::parse_error& e) {
        THROW_INVALID_CONFIGURATION("Plan is not valid JSON: ", e.what());
    }
    if (!root.is_object()) {
        THROW_INVALID_CONFIGURATION("Plan must be a JSON object");
    }

    PlanConfig plan;
    if (!readSection(root, plan.observation)) {
        THROW_INVALID_CONFIGURATION("Plan has no '",
                                    std::string(ObservationConfig::path()),
                                    "' section");
    }
    readSection(root, plan.instrument);
    readSection(root, plan.logging);
    return plan;
}

PlanConfig loadPlanConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        THROW_INVALID_CONFIGURATION("Cannot open plan file: ", path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto plan = parsePlanConfig(buffer.str());
    spdlog::debug("Loaded plan for {} ({}) from {}", plan.observation.target,
                  observationModeToString(plan.observation.mode),
                  path.string());
    return plan;
}

}  // namespace tessera::config
