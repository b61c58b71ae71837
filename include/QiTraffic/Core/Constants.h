#pragma once

/**
 * @file Constants.h
 * @brief Numeric constants shared by the geometry and analysis modules
 */

#include <cstddef>

namespace Qi::Traffic {

/// Tolerance for coordinate comparisons (image space, pixels)
constexpr double GEOM_TOLERANCE = 1e-9;

/// Segments shorter than this are treated as points
constexpr double MIN_SEGMENT_LENGTH = 1e-12;

/// Cross products below this magnitude are treated as parallel
constexpr double INTERSECTION_SINGULAR_TOLERANCE = 1e-12;

/// Minimum number of detections a track must own
constexpr std::size_t MIN_TRACK_DETECTIONS = 2;

/// Minimum number of ring coordinates of an area (closed triangle)
constexpr std::size_t MIN_AREA_COORDINATES = 4;

} // namespace Qi::Traffic
