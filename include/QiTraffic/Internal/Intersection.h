#pragma once

/**
 * @file Intersection.h
 * @brief Segment-segment intersection between 2D primitives
 *
 * This module provides:
 * - Segment-Segment intersection point and parameters
 * - All split parameters of a segment against another (collinear overlaps
 *   yield both overlap endpoints)
 * - Fast boolean predicates with bounding-box rejection
 *
 * Used by:
 * - Geometry: polyline/polyline, polyline/polygon predicates and splitting
 * - Cut: per-detection-pair cutting test
 *
 * Conventions:
 * - Touching counts as intersecting (closed segments, tolerance GEOM_TOLERANCE)
 * - Collinear overlapping segments intersect
 * - A zero-length segment is a point and intersects what it lies on
 */

#include <QiTraffic/Core/Types.h>
#include <QiTraffic/Core/Constants.h>

#include <vector>

namespace Qi::Traffic::Internal {

// =============================================================================
// Result Structures
// =============================================================================

/**
 * @brief Result of single-point intersection calculation
 */
struct IntersectionResult {
    bool exists = false;        ///< True if intersection exists
    Coordinate point;           ///< Intersection point
    double param1 = 0.0;        ///< Parameter on first segment, [0, 1]
    double param2 = 0.0;        ///< Parameter on second segment, [0, 1]

    /// Check if intersection exists
    operator bool() const { return exists; }

    /// Create result for no intersection
    static IntersectionResult None() { return IntersectionResult{}; }

    /// Create result with intersection point
    static IntersectionResult At(const Coordinate& p, double t1 = 0.0, double t2 = 0.0) {
        IntersectionResult r;
        r.exists = true;
        r.point = p;
        r.param1 = t1;
        r.param2 = t2;
        return r;
    }
};

// =============================================================================
// Segment-Segment Intersection
// =============================================================================

/**
 * @brief Compute intersection of two line segments
 *
 * @param seg1 First segment
 * @param seg2 Second segment
 * @return Intersection result with t parameters in [0,1] for both segments
 *
 * @note For overlapping segments, returns the overlap endpoint closest to seg1.p1
 */
IntersectionResult IntersectSegmentSegment(const Segment2d& seg1, const Segment2d& seg2);

/**
 * @brief Parameters on seg1 at which seg2 touches or crosses it
 *
 * @return Empty if disjoint, one parameter for a crossing/touching point,
 *         two parameters (start, end of overlap, ascending) for collinear overlap
 */
std::vector<double> SegmentIntersectionParams(const Segment2d& seg1, const Segment2d& seg2);

/**
 * @brief Check if two segments share at least one point
 */
bool SegmentsIntersect(const Segment2d& seg1, const Segment2d& seg2);

/**
 * @brief Check if any segment of polyline1 intersects any segment of polyline2
 *
 * Polylines with fewer than two points are treated as a single point.
 */
bool PolylinesIntersect(const std::vector<Coordinate>& polyline1,
                        const std::vector<Coordinate>& polyline2);

} // namespace Qi::Traffic::Internal
