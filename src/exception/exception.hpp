/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-2

Description: Planner Exceptions

**************************************************/

#ifndef TESSERA_EXCEPTION_EXCEPTION_HPP
#define TESSERA_EXCEPTION_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace tessera {

// ============================================================================
// Planning Exceptions
// ============================================================================

/**
 * @brief Thrown when an input is out of range or has the wrong shape.
 *
 * Covers non-positive FOV sizes, overlaps outside [0, 1), margins at or
 * below -1, non-positive slew rates and empty point lists.
 */
class InvalidParameter : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Thrown when a celestial geometry query cannot be resolved.
 */
class GeometryUnavailable : public atom::error::Exception {
public:
    using Exception::Exception;
};

// ============================================================================
// Input/Output Exceptions
// ============================================================================

/**
 * @brief Thrown when a pointing request document cannot be parsed.
 */
class PtrParseError : public atom::error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief Thrown when a configuration file is unreadable or malformed.
 */
class InvalidConfiguration : public atom::error::Exception {
public:
    using Exception::Exception;
};

}  // namespace tessera

#define THROW_INVALID_PARAMETER(...)                                    \
    throw tessera::InvalidParameter(ATOM_FILE_NAME, ATOM_FILE_LINE,     \
                                    ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_GEOMETRY_UNAVAILABLE(...)                                 \
    throw tessera::GeometryUnavailable(ATOM_FILE_NAME, ATOM_FILE_LINE,  \
                                       ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_PTR_PARSE_ERROR(...)                                      \
    throw tessera::PtrParseError(ATOM_FILE_NAME, ATOM_FILE_LINE,        \
                                 ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_CONFIGURATION(...)                                \
    throw tessera::InvalidConfiguration(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                        ATOM_FUNC_NAME, __VA_ARGS__)

#endif  // TESSERA_EXCEPTION_EXCEPTION_HPP
