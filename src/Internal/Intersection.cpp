/**
 * @file Intersection.cpp
 * @brief Implementation of segment intersection calculations
 */

#include <QiTraffic/Internal/Intersection.h>
#include <QiTraffic/Internal/GeomRelation.h>

#include <algorithm>
#include <cmath>

namespace Qi::Traffic::Internal {

namespace {

struct BoundingBox {
    double minX, minY, maxX, maxY;

    bool Overlaps(const BoundingBox& other, double tolerance) const {
        return minX <= other.maxX + tolerance && other.minX <= maxX + tolerance &&
               minY <= other.maxY + tolerance && other.minY <= maxY + tolerance;
    }
};

BoundingBox BoundsOf(const Segment2d& seg) {
    return {std::min(seg.p1.x, seg.p2.x), std::min(seg.p1.y, seg.p2.y),
            std::max(seg.p1.x, seg.p2.x), std::max(seg.p1.y, seg.p2.y)};
}

BoundingBox BoundsOf(const std::vector<Coordinate>& points) {
    BoundingBox box{points.front().x, points.front().y, points.front().x, points.front().y};
    for (const auto& p : points) {
        box.minX = std::min(box.minX, p.x);
        box.minY = std::min(box.minY, p.y);
        box.maxX = std::max(box.maxX, p.x);
        box.maxY = std::max(box.maxY, p.y);
    }
    return box;
}

bool IsDegenerate(const Segment2d& seg) {
    Coordinate d = seg.Direction();
    return d.Dot(d) < MIN_SEGMENT_LENGTH * MIN_SEGMENT_LENGTH;
}

} // anonymous namespace

// =============================================================================
// Segment-Segment Intersection
// =============================================================================

IntersectionResult IntersectSegmentSegment(const Segment2d& seg1, const Segment2d& seg2) {
    if (!BoundsOf(seg1).Overlaps(BoundsOf(seg2), GEOM_TOLERANCE)) {
        return IntersectionResult::None();
    }

    // Degenerate segments are points
    if (IsDegenerate(seg1)) {
        if (!PointOnSegment(seg1.p1, seg2)) {
            return IntersectionResult::None();
        }
        return IntersectionResult::At(seg1.p1, 0.0,
                                      std::clamp(seg2.ProjectPoint(seg1.p1), 0.0, 1.0));
    }
    if (IsDegenerate(seg2)) {
        if (!PointOnSegment(seg2.p1, seg1)) {
            return IntersectionResult::None();
        }
        return IntersectionResult::At(seg2.p1,
                                      std::clamp(seg1.ProjectPoint(seg2.p1), 0.0, 1.0), 0.0);
    }

    Coordinate d1 = seg1.Direction();
    Coordinate d2 = seg2.Direction();

    double cross = d1.Cross(d2);

    // Check for parallel segments
    if (std::abs(cross) < INTERSECTION_SINGULAR_TOLERANCE) {
        // Parallel - only collinear segments can overlap
        Coordinate toSeg2 = seg2.p1 - seg1.p1;
        if (std::abs(d1.Cross(toSeg2)) > GEOM_TOLERANCE * d1.Norm()) {
            return IntersectionResult::None();
        }

        // Project seg2 endpoints onto seg1
        double len1Sq = d1.Dot(d1);
        double t1 = (seg2.p1 - seg1.p1).Dot(d1) / len1Sq;
        double t2 = (seg2.p2 - seg1.p1).Dot(d1) / len1Sq;
        if (t1 > t2) std::swap(t1, t2);

        double tol = GEOM_TOLERANCE / std::sqrt(len1Sq);
        if (t2 < -tol || t1 > 1.0 + tol) {
            return IntersectionResult::None();
        }

        double tOverlap = std::clamp(t1, 0.0, 1.0);
        Coordinate overlapPoint = seg1.PointAt(tOverlap);
        double s = std::clamp(seg2.ProjectPoint(overlapPoint), 0.0, 1.0);
        return IntersectionResult::At(overlapPoint, tOverlap, s);
    }

    // Non-parallel segments
    Coordinate toSeg2 = seg2.p1 - seg1.p1;

    double t = toSeg2.Cross(d2) / cross;
    double s = toSeg2.Cross(d1) / cross;

    // Tolerances are expressed in length units along each segment
    double tolT = GEOM_TOLERANCE / d1.Norm();
    double tolS = GEOM_TOLERANCE / d2.Norm();
    if (t < -tolT || t > 1.0 + tolT || s < -tolS || s > 1.0 + tolS) {
        return IntersectionResult::None();
    }

    t = std::clamp(t, 0.0, 1.0);
    s = std::clamp(s, 0.0, 1.0);

    return IntersectionResult::At(seg1.PointAt(t), t, s);
}

std::vector<double> SegmentIntersectionParams(const Segment2d& seg1, const Segment2d& seg2) {
    std::vector<double> params;

    IntersectionResult first = IntersectSegmentSegment(seg1, seg2);
    if (!first.exists) {
        return params;
    }
    params.push_back(first.param1);

    // Collinear overlap: also report the far end of the overlap
    if (!IsDegenerate(seg1) && !IsDegenerate(seg2) &&
        std::abs(seg1.Direction().Cross(seg2.Direction())) < INTERSECTION_SINGULAR_TOLERANCE) {
        double t1 = std::clamp(seg1.ProjectPoint(seg2.p1), 0.0, 1.0);
        double t2 = std::clamp(seg1.ProjectPoint(seg2.p2), 0.0, 1.0);
        double tEnd = std::max(t1, t2);
        if (tEnd - first.param1 > GEOM_TOLERANCE / seg1.Length()) {
            params.push_back(tEnd);
        }
    }

    return params;
}

bool SegmentsIntersect(const Segment2d& seg1, const Segment2d& seg2) {
    return IntersectSegmentSegment(seg1, seg2).exists;
}

bool PolylinesIntersect(const std::vector<Coordinate>& polyline1,
                        const std::vector<Coordinate>& polyline2) {
    if (polyline1.empty() || polyline2.empty()) {
        return false;
    }
    if (!BoundsOf(polyline1).Overlaps(BoundsOf(polyline2), GEOM_TOLERANCE)) {
        return false;
    }

    size_t n1 = polyline1.size() > 1 ? polyline1.size() - 1 : 1;
    size_t n2 = polyline2.size() > 1 ? polyline2.size() - 1 : 1;

    for (size_t i = 0; i < n1; ++i) {
        Segment2d seg1(polyline1[i], polyline1[std::min(i + 1, polyline1.size() - 1)]);
        for (size_t j = 0; j < n2; ++j) {
            Segment2d seg2(polyline2[j], polyline2[std::min(j + 1, polyline2.size() - 1)]);
            if (SegmentsIntersect(seg1, seg2)) {
                return true;
            }
        }
    }
    return false;
}

} // namespace Qi::Traffic::Internal
