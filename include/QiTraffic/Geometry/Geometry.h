#pragma once

/**
 * @file Geometry.h
 * @brief Polyline and polygon operations used by the intersection engine
 *
 * Provides:
 * - Line (open polyline) and Polygon (coordinate ring) value types
 * - LineIntersectsLine / LineIntersectsPolygon predicates
 * - CoordinatesWithinPolygon batched containment
 * - SplitLineWithLine partitioning
 * - DistanceBetween
 *
 * Boundary conventions (they decide count parity at section edges):
 * - Intersection predicates are closed: touching an endpoint or a vertex,
 *   or overlapping collinearly, counts as intersecting.
 * - Containment is open: a point on the polygon boundary is NOT within.
 * - Splitting at an existing vertex of the subject does not insert a new
 *   point; splitting inside a segment inserts the intersection point, which
 *   then ends one sub-line and starts the next.
 * All comparisons use GEOM_TOLERANCE.
 */

#include <QiTraffic/Core/Types.h>
#include <QiTraffic/Core/Export.h>

#include <optional>
#include <vector>

namespace Qi::Traffic::Geometry {

// =============================================================================
// Value Types
// =============================================================================

/**
 * @brief Open polyline with at least two coordinates
 */
class QITRAFFIC_API Line {
public:
    /// @throws InvalidArgumentException if fewer than two coordinates are given
    explicit Line(std::vector<Coordinate> coordinates);

    const std::vector<Coordinate>& Coordinates() const { return coordinates_; }
    size_t Size() const { return coordinates_.size(); }

    bool operator==(const Line& other) const { return coordinates_ == other.coordinates_; }
    bool operator!=(const Line& other) const { return !(*this == other); }

private:
    std::vector<Coordinate> coordinates_;
};

/**
 * @brief Polygon given by its coordinate ring (closing point optional)
 */
class QITRAFFIC_API Polygon {
public:
    /// @throws InvalidArgumentException if fewer than three coordinates are given
    explicit Polygon(std::vector<Coordinate> coordinates);

    const std::vector<Coordinate>& Coordinates() const { return coordinates_; }

private:
    std::vector<Coordinate> coordinates_;
};

// =============================================================================
// Operations
// =============================================================================

/**
 * @brief Check if two polylines share at least one point
 */
QITRAFFIC_API bool LineIntersectsLine(const Line& line1, const Line& line2);

/**
 * @brief Check if a polyline touches the polygon boundary or enters its interior
 */
QITRAFFIC_API bool LineIntersectsPolygon(const Line& line, const Polygon& polygon);

/**
 * @brief Containment test for a batch of points
 * @return One flag per point, true iff the point lies strictly inside the polygon
 */
QITRAFFIC_API std::vector<bool> CoordinatesWithinPolygon(const std::vector<Coordinate>& points,
                                                         const Polygon& polygon);

/**
 * @brief Partition `subject` at every point it shares with `splitter`
 *
 * @return std::nullopt if the subject is not split (no intersection, or only
 *         at its own start/end point); otherwise the sub-lines in the subject's
 *         point order. Consecutive sub-lines share their split point.
 */
QITRAFFIC_API std::optional<std::vector<Line>> SplitLineWithLine(const Line& subject,
                                                                 const Line& splitter);

/**
 * @brief Euclidean distance between two coordinates
 */
QITRAFFIC_API double DistanceBetween(const Coordinate& p1, const Coordinate& p2);

} // namespace Qi::Traffic::Geometry
