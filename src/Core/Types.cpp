#include <QiTraffic/Core/Types.h>
#include <QiTraffic/Core/Constants.h>
#include <QiTraffic/Core/Validate.h>

namespace Qi::Traffic {

// =============================================================================
// Segment2d Implementation
// =============================================================================

double Segment2d::ProjectPoint(const Coordinate& p) const {
    Coordinate d = Direction();
    double lenSq = d.Dot(d);
    if (lenSq < MIN_SEGMENT_LENGTH * MIN_SEGMENT_LENGTH) {
        return 0.0;
    }
    return (p - p1).Dot(d) / lenSq;
}

// =============================================================================
// RelativeOffsetCoordinate Implementation
// =============================================================================

RelativeOffsetCoordinate::RelativeOffsetCoordinate(double x_, double y_)
    : x(x_), y(y_) {
    Validate::RequireInRange(x, 0.0, 1.0, "x", "RelativeOffsetCoordinate");
    Validate::RequireInRange(y, 0.0, 1.0, "y", "RelativeOffsetCoordinate");
}

} // namespace Qi::Traffic
