#pragma once

/**
 * @file GeomRelation.h
 * @brief Point-segment and point-polygon relationships
 *
 * Polygons are given as coordinate rings; a repeated closing point
 * (first == last) is accepted and contributes a zero-length edge only.
 */

#include <QiTraffic/Core/Types.h>
#include <QiTraffic/Core/Constants.h>

#include <vector>

namespace Qi::Traffic::Internal {

/**
 * @brief Relationship between point and polygon
 */
enum class PointPolygonRelation {
    Inside,         ///< Point is inside polygon
    OnBoundary,     ///< Point is on polygon edge
    Outside         ///< Point is outside polygon
};

/**
 * @brief Check if point lies on a segment (within tolerance)
 *
 * A zero-length segment is treated as its endpoint.
 */
bool PointOnSegment(const Coordinate& point, const Segment2d& segment,
                    double tolerance = GEOM_TOLERANCE);

/**
 * @brief Check if point lies on any polygon edge
 */
bool PointOnPolygonBoundary(const Coordinate& point, const std::vector<Coordinate>& polygon,
                            double tolerance = GEOM_TOLERANCE);

/**
 * @brief Classify point against polygon (ray casting, boundary checked first)
 * @return PointPolygonRelation enum; polygons with < 3 points yield Outside
 */
PointPolygonRelation PointInPolygon(const Coordinate& point, const std::vector<Coordinate>& polygon,
                                    double tolerance = GEOM_TOLERANCE);

/**
 * @brief Batched PointInPolygon
 * @return One relation per input point, in input order
 */
std::vector<PointPolygonRelation> PointsInPolygon(const std::vector<Coordinate>& points,
                                                  const std::vector<Coordinate>& polygon,
                                                  double tolerance = GEOM_TOLERANCE);

} // namespace Qi::Traffic::Internal
