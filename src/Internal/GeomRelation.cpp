/**
 * @file GeomRelation.cpp
 * @brief Point, segment and polygon relations used by section tests
 */

#include <QiTraffic/Internal/GeomRelation.h>

#include <algorithm>
#include <cmath>

namespace Qi::Traffic::Internal {

bool PointOnSegment(const Coordinate& point, const Segment2d& segment, double tolerance) {
    double length = segment.Length();
    if (length < MIN_SEGMENT_LENGTH) {
        return point.DistanceTo(segment.p1) <= tolerance;
    }

    // Distance to carrier line
    Coordinate d = segment.Direction();
    double signedDistance = d.Cross(point - segment.p1) / length;
    if (std::abs(signedDistance) > tolerance) {
        return false;
    }

    // Projection must fall within segment
    double t = segment.ProjectPoint(point);
    return t >= -tolerance / length && t <= 1.0 + tolerance / length;
}

bool PointOnPolygonBoundary(const Coordinate& point, const std::vector<Coordinate>& polygon,
                            double tolerance) {
    size_t n = polygon.size();
    for (size_t i = 0; i < n; ++i) {
        Segment2d edge(polygon[i], polygon[(i + 1) % n]);
        if (PointOnSegment(point, edge, tolerance)) {
            return true;
        }
    }
    return false;
}

PointPolygonRelation PointInPolygon(const Coordinate& point, const std::vector<Coordinate>& polygon,
                                    double tolerance) {
    if (polygon.size() < 3) return PointPolygonRelation::Outside;

    if (PointOnPolygonBoundary(point, polygon, tolerance)) {
        return PointPolygonRelation::OnBoundary;
    }

    // Ray casting algorithm
    size_t n = polygon.size();
    int crossings = 0;

    for (size_t i = 0; i < n; ++i) {
        const Coordinate& p1 = polygon[i];
        const Coordinate& p2 = polygon[(i + 1) % n];

        // Check if ray from point going right crosses this edge
        if ((p1.y <= point.y && p2.y > point.y) || (p2.y <= point.y && p1.y > point.y)) {
            double t = (point.y - p1.y) / (p2.y - p1.y);
            double xIntersect = p1.x + t * (p2.x - p1.x);

            if (point.x < xIntersect) {
                crossings++;
            }
        }
    }

    return (crossings % 2 == 1) ? PointPolygonRelation::Inside : PointPolygonRelation::Outside;
}

std::vector<PointPolygonRelation> PointsInPolygon(const std::vector<Coordinate>& points,
                                                  const std::vector<Coordinate>& polygon,
                                                  double tolerance) {
    std::vector<PointPolygonRelation> relations;
    relations.reserve(points.size());

    if (polygon.size() < 3) {
        relations.assign(points.size(), PointPolygonRelation::Outside);
        return relations;
    }

    // Bounding box rejection shared by the whole batch
    double minX = polygon.front().x, maxX = minX;
    double minY = polygon.front().y, maxY = minY;
    for (const auto& p : polygon) {
        minX = std::min(minX, p.x);
        maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y);
        maxY = std::max(maxY, p.y);
    }

    for (const auto& point : points) {
        if (point.x < minX - tolerance || point.x > maxX + tolerance ||
            point.y < minY - tolerance || point.y > maxY + tolerance) {
            relations.push_back(PointPolygonRelation::Outside);
            continue;
        }
        relations.push_back(PointInPolygon(point, polygon, tolerance));
    }
    return relations;
}

} // namespace Qi::Traffic::Internal
