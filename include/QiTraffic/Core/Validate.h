#pragma once

/**
 * @file Validate.h
 * @brief Unified validation utilities for QiTraffic value objects
 *
 * Design principles:
 * - Validation happens once, in constructors; objects are immutable afterwards
 * - Invalid input throws, with a consistent message format:
 *   "<context>: <field> must be <constraint>, got <value>"
 */

#include <QiTraffic/Core/Export.h>
#include <QiTraffic/Core/Exception.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

namespace Qi::Traffic::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatValue(int64_t val) {
    return std::to_string(val);
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

} // namespace Detail

// =============================================================================
// Numeric Validation
// =============================================================================

/**
 * @brief Require value >= 0
 * @throws InvalidArgumentException if value is negative or NaN
 */
inline void RequireNonNegative(double value, const char* name, const char* context) {
    if (!(value >= 0.0)) {
        throw InvalidArgumentException(
            std::string(context) + ": " + name + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Require min <= value <= max
 * @throws InvalidArgumentException if value is outside the closed range or NaN
 */
inline void RequireInRange(double value, double minVal, double maxVal,
                           const char* name, const char* context) {
    if (!(value >= minVal && value <= maxVal)) {
        throw InvalidArgumentException(
            std::string(context) + ": " + name + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Require value >= minVal for integral counts and indices
 * @throws InvalidArgumentException if value < minVal
 */
inline void RequireAtLeast(int64_t value, int64_t minVal,
                           const char* name, const char* context) {
    if (value < minVal) {
        throw InvalidArgumentException(
            std::string(context) + ": " + name + " must be >= " +
            Detail::FormatValue(minVal) + ", got " + Detail::FormatValue(value));
    }
}

} // namespace Qi::Traffic::Validate
