/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-6

Description: ConfigSection CRTP base class for type-safe plan configuration

**************************************************/

#ifndef TESSERA_CONFIG_CONFIG_SECTION_HPP
#define TESSERA_CONFIG_CONFIG_SECTION_HPP

#include <concepts>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "exception/exception.hpp"

namespace tessera::config {

using json = nlohmann::json;

/**
 * @brief Requirements on a section of a plan file
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
    { T::generateSchema() } -> std::convertible_to<json>;
};

/**
 * @brief CRTP base shared by the instrument, observation and logging
 * sections of a plan file
 *
 * A section names its key through PATH and provides serialize(),
 * deserialize() and generateSchema(). deserialize() throws
 * InvalidConfiguration for values outside their valid range; fromJson()
 * additionally maps nlohmann type errors onto InvalidConfiguration.
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 */
template <typename Derived>
class ConfigSection {
public:
    /**
     * @brief Get the configuration path for this section
     * @return Key of the section in a plan file (e.g., "instrument")
     */
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    /// Section contents as they appear under path()
    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    /**
     * @brief Create a configuration from JSON
     * @throws InvalidConfiguration if a value has the wrong type or range
     */
    [[nodiscard]] static Derived fromJson(const json& j) {
        if (!j.is_object()) {
            THROW_INVALID_CONFIGURATION("Section '", std::string(path()),
                                        "' must be a JSON object");
        }
        try {
            return Derived::deserialize(j);
        } catch (const json::exception& e) {
            THROW_INVALID_CONFIGURATION("Section '", std::string(path()),
                                        "': ", e.what());
        }
    }

    /**
     * @brief JSON Schema of the section, as written by the derived type
     */
    [[nodiscard]] static json schema() { return Derived::generateSchema(); }

protected:
    /// Adds a typed property with its default to a section schema
    template <typename T>
    static void addSchemaProperty(json& schema, const std::string& name,
                                  const std::string& type, const T& defaultValue,
                                  const std::string& description = "") {
        if (!schema.contains("properties")) {
            schema["properties"] = json::object();
        }
        json& prop = schema["properties"][name];
        prop["type"] = type;
        prop["default"] = defaultValue;
        if (!description.empty()) {
            prop["description"] = description;
        }
    }

    /// Bounds a numeric property already present in the schema
    static void addRange(json& schema, const std::string& name,
                         std::optional<double> minimum = std::nullopt,
                         std::optional<double> maximum = std::nullopt) {
        if (schema.contains("properties") && schema["properties"].contains(name)) {
            auto& prop = schema["properties"][name];
            if (minimum) {
                prop["minimum"] = *minimum;
            }
            if (maximum) {
                prop["maximum"] = *maximum;
            }
        }
    }
};

}  // namespace tessera::config

#endif  // TESSERA_CONFIG_CONFIG_SECTION_HPP
