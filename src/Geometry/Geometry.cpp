/**
 * @file Geometry.cpp
 * @brief Polyline and polygon operations
 */

#include <QiTraffic/Geometry/Geometry.h>
#include <QiTraffic/Core/Constants.h>
#include <QiTraffic/Core/Validate.h>
#include <QiTraffic/Internal/GeomRelation.h>
#include <QiTraffic/Internal/Intersection.h>

#include <algorithm>
#include <utility>

namespace Qi::Traffic::Geometry {

using Internal::PointPolygonRelation;

// =============================================================================
// Value Types
// =============================================================================

Line::Line(std::vector<Coordinate> coordinates)
    : coordinates_(std::move(coordinates)) {
    Validate::RequireAtLeast(static_cast<int64_t>(coordinates_.size()), 2,
                             "number of coordinates", "Line");
}

Polygon::Polygon(std::vector<Coordinate> coordinates)
    : coordinates_(std::move(coordinates)) {
    Validate::RequireAtLeast(static_cast<int64_t>(coordinates_.size()), 3,
                             "number of coordinates", "Polygon");
}

// =============================================================================
// Predicates
// =============================================================================

bool LineIntersectsLine(const Line& line1, const Line& line2) {
    return Internal::PolylinesIntersect(line1.Coordinates(), line2.Coordinates());
}

bool LineIntersectsPolygon(const Line& line, const Polygon& polygon) {
    std::vector<Coordinate> ring = polygon.Coordinates();
    if (ring.front() != ring.back()) {
        ring.push_back(ring.front());
    }
    if (Internal::PolylinesIntersect(line.Coordinates(), ring)) {
        return true;
    }
    // No boundary contact: either fully inside or fully outside
    return Internal::PointInPolygon(line.Coordinates().front(), ring) ==
           PointPolygonRelation::Inside;
}

std::vector<bool> CoordinatesWithinPolygon(const std::vector<Coordinate>& points,
                                           const Polygon& polygon) {
    std::vector<PointPolygonRelation> relations =
        Internal::PointsInPolygon(points, polygon.Coordinates());

    std::vector<bool> within;
    within.reserve(relations.size());
    for (PointPolygonRelation relation : relations) {
        within.push_back(relation == PointPolygonRelation::Inside);
    }
    return within;
}

// =============================================================================
// Splitting
// =============================================================================

std::optional<std::vector<Line>> SplitLineWithLine(const Line& subject, const Line& splitter) {
    const std::vector<Coordinate>& points = subject.Coordinates();
    const std::vector<Coordinate>& cutter = splitter.Coordinates();
    const size_t lastVertex = points.size() - 1;

    if (!Internal::PolylinesIntersect(points, cutter)) {
        return std::nullopt;
    }

    // Pass 1: split vertices and interior split parameters per subject segment
    std::vector<bool> splitAtVertex(points.size(), false);
    std::vector<std::vector<double>> interiorParams(lastVertex);

    for (size_t i = 0; i < lastVertex; ++i) {
        Segment2d segment(points[i], points[i + 1]);
        double length = segment.Length();
        double tolT = length > MIN_SEGMENT_LENGTH ? GEOM_TOLERANCE / length : 1.0;

        for (size_t j = 0; j + 1 < cutter.size(); ++j) {
            Segment2d cut(cutter[j], cutter[j + 1]);
            for (double t : Internal::SegmentIntersectionParams(segment, cut)) {
                if (t <= tolT) {
                    splitAtVertex[i] = true;
                } else if (t >= 1.0 - tolT) {
                    splitAtVertex[i + 1] = true;
                } else {
                    interiorParams[i].push_back(t);
                }
            }
        }

        std::vector<double>& params = interiorParams[i];
        std::sort(params.begin(), params.end());
        params.erase(std::unique(params.begin(), params.end(),
                                 [tolT](double a, double b) { return b - a <= tolT; }),
                     params.end());
    }

    // Pass 2: assemble sub-lines in subject order
    std::vector<Line> pieces;
    std::vector<Coordinate> current{points.front()};

    auto closePieceAt = [&pieces, &current](const Coordinate& splitPoint) {
        pieces.emplace_back(std::move(current));
        current = std::vector<Coordinate>{splitPoint};
    };

    for (size_t i = 0; i < lastVertex; ++i) {
        Segment2d segment(points[i], points[i + 1]);
        for (double t : interiorParams[i]) {
            Coordinate splitPoint = segment.PointAt(t);
            current.push_back(splitPoint);
            closePieceAt(splitPoint);
        }

        current.push_back(points[i + 1]);
        if (splitAtVertex[i + 1] && i + 1 < lastVertex) {
            closePieceAt(points[i + 1]);
        }
    }
    pieces.emplace_back(std::move(current));

    if (pieces.size() < 2) {
        return std::nullopt;
    }
    return pieces;
}

double DistanceBetween(const Coordinate& p1, const Coordinate& p2) {
    return p1.DistanceTo(p2);
}

} // namespace Qi::Traffic::Geometry
