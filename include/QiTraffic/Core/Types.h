#pragma once

/**
 * @file Types.h
 * @brief Core value types for QiTraffic (image space geometry)
 */

#include <QiTraffic/Core/Export.h>

#include <cmath>
#include <cstddef>
#include <functional>

namespace Qi::Traffic {

// =============================================================================
// Coordinate
// =============================================================================

/**
 * @brief 2D point in image space with sub-pixel precision
 *
 * Equality is exact value equality; use DistanceTo() with a tolerance for
 * geometric comparisons.
 */
struct QITRAFFIC_API Coordinate {
    double x = 0.0;
    double y = 0.0;

    Coordinate() = default;
    Coordinate(double x_, double y_) : x(x_), y(y_) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y); }

    /// Vector addition
    Coordinate operator+(const Coordinate& other) const {
        return {x + other.x, y + other.y};
    }

    /// Vector subtraction
    Coordinate operator-(const Coordinate& other) const {
        return {x - other.x, y - other.y};
    }

    /// Scalar multiplication
    Coordinate operator*(double s) const {
        return {x * s, y * s};
    }

    bool operator==(const Coordinate& other) const {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Coordinate& other) const {
        return !(*this == other);
    }

    /// Euclidean norm
    double Norm() const {
        return std::sqrt(x * x + y * y);
    }

    /// Dot product
    double Dot(const Coordinate& other) const {
        return x * other.x + y * other.y;
    }

    /// Cross product (2D: returns scalar)
    double Cross(const Coordinate& other) const {
        return x * other.y - y * other.x;
    }

    /// Distance to another point
    double DistanceTo(const Coordinate& other) const {
        return (*this - other).Norm();
    }
};

// =============================================================================
// Segment2d
// =============================================================================

/**
 * @brief 2D line segment defined by two endpoints
 */
struct QITRAFFIC_API Segment2d {
    Coordinate p1;
    Coordinate p2;

    Segment2d() = default;
    Segment2d(const Coordinate& start, const Coordinate& end) : p1(start), p2(end) {}
    Segment2d(double x1, double y1, double x2, double y2) : p1(x1, y1), p2(x2, y2) {}

    /// Segment length
    double Length() const { return p1.DistanceTo(p2); }

    /// Direction vector (not normalized)
    Coordinate Direction() const { return p2 - p1; }

    /// Project point onto the segment's carrier line (parameter t, 0=p1, 1=p2)
    double ProjectPoint(const Coordinate& p) const;

    /// Get point on segment at parameter t (0=p1, 1=p2)
    Coordinate PointAt(double t) const {
        return p1 + Direction() * t;
    }

    bool IsValid() const { return p1.IsValid() && p2.IsValid(); }
};

// =============================================================================
// Direction and Offset Types
// =============================================================================

/**
 * @brief Movement between two sampled track points (dx, dy)
 */
struct QITRAFFIC_API DirectionVector2d {
    double x1 = 0.0;    ///< dx
    double x2 = 0.0;    ///< dy

    DirectionVector2d() = default;
    DirectionVector2d(double dx, double dy) : x1(dx), x2(dy) {}

    /// Vector pointing from `from` to `to`
    static DirectionVector2d Between(const Coordinate& from, const Coordinate& to) {
        return {to.x - from.x, to.y - from.y};
    }

    bool operator==(const DirectionVector2d& other) const {
        return x1 == other.x1 && x2 == other.x2;
    }

    bool operator!=(const DirectionVector2d& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Position inside a bounding box, both components in [0, 1]
 *
 * (0, 0) is the top-left corner, (0.5, 1) the bottom center.
 */
struct QITRAFFIC_API RelativeOffsetCoordinate {
    double x = 0.0;
    double y = 0.0;

    RelativeOffsetCoordinate() = default;

    /// @throws InvalidArgumentException if a component is outside [0, 1]
    RelativeOffsetCoordinate(double x_, double y_);

    bool operator==(const RelativeOffsetCoordinate& other) const {
        return x == other.x && y == other.y;
    }

    bool operator!=(const RelativeOffsetCoordinate& other) const {
        return !(*this == other);
    }
};

} // namespace Qi::Traffic

namespace std {

template<>
struct hash<Qi::Traffic::Coordinate> {
    size_t operator()(const Qi::Traffic::Coordinate& c) const noexcept {
        size_t hx = std::hash<double>()(c.x);
        size_t hy = std::hash<double>()(c.y);
        return hx ^ (hy + 0x9e3779b97f4a7c15ULL + (hx << 6) + (hx >> 2));
    }
};

} // namespace std
