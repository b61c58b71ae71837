#include <QiTraffic/Intersect/Intersector.h>
#include <QiTraffic/Core/Constants.h>
#include <QiTraffic/Core/Exception.h>
#include <QiTraffic/Geometry/Geometry.h>


namespace Qi::Traffic::Intersect {

namespace {

// Set direction and position for the event anchored at `to`
void PrepareEvent(EventBuilder& builder, const Coordinate& from, const Coordinate& to) {
    builder.AddDirectionVector(DirectionVector2d::Between(from, to));
    builder.AddEventCoordinate(to.x, to.y);
}

} // anonymous namespace

// =============================================================================
// SmallestSegmentsIntersector
// =============================================================================

std::vector<Event> SmallestSegmentsIntersector::Intersect(const Track& track,
                                                          EventBuilder& builder) const {
    std::vector<Event> events;

    builder.AddRoadUserType(track.Classification());
    const RelativeOffsetCoordinate& offset = section_.GetOffset(EventType::SectionEnter);

    std::vector<Coordinate> points = track.Coordinates(offset);
    if (points.size() < MIN_TRACK_DETECTIONS) {
        return events;
    }

    Geometry::Line sectionLine(section_.Coordinates());
    if (!Geometry::LineIntersectsLine(Geometry::Line(points), sectionLine)) {
        return events;
    }

    const std::vector<Detection>& detections = track.Detections();
    for (size_t i = 1; i < points.size(); ++i) {
        Geometry::Line segment({points[i - 1], points[i]});
        if (Geometry::LineIntersectsLine(sectionLine, segment)) {
            PrepareEvent(builder, points[i - 1], points[i]);
            events.push_back(builder.CreateEvent(detections[i]));
        }
    }
    return events;
}

// =============================================================================
// AreaPointsIntersector
// =============================================================================

std::vector<Event> AreaPointsIntersector::Intersect(const Track& track,
                                                    EventBuilder& builder) const {
    std::vector<Event> events;

    builder.AddRoadUserType(track.Classification());
    const RelativeOffsetCoordinate& offset = area_.GetOffset(EventType::SectionEnter);

    std::vector<Coordinate> points = track.Coordinates(offset);
    if (points.size() < MIN_TRACK_DETECTIONS) {
        return events;
    }

    std::vector<bool> inside = Geometry::CoordinatesWithinPolygon(
        points, Geometry::Polygon(area_.Coordinates()));
    const std::vector<Detection>& detections = track.Detections();

    if (inside[0]) {
        builder.AddEventType(EventType::SectionEnter);
        builder.AddDirectionVector(DirectionVector2d::Between(points[0], points[1]));
        builder.AddEventCoordinate(points[0].x, points[0].y);
        events.push_back(builder.CreateEvent(detections[0]));
    }

    bool currentlyInside = inside[0];
    for (size_t i = 1; i < points.size(); ++i) {
        if (inside[i] == currentlyInside) {
            continue;
        }
        PrepareEvent(builder, points[i - 1], points[i]);
        builder.AddEventType(inside[i] ? EventType::SectionEnter : EventType::SectionLeave);
        events.push_back(builder.CreateEvent(detections[i]));
        currentlyInside = inside[i];
    }
    return events;
}

// =============================================================================
// SplittingLineIntersector
// =============================================================================

std::vector<Event> SplittingLineIntersector::Intersect(const Track& track,
                                                       EventBuilder& builder) const {
    std::vector<Event> events;

    const std::optional<EventType>& eventType = builder.GetEventType();
    if (!eventType) {
        throw BuilderSetupException("event type must be set before splitting a track");
    }
    builder.AddRoadUserType(track.Classification());
    const RelativeOffsetCoordinate& offset = section_.GetOffset(*eventType);

    std::vector<Coordinate> points = track.Coordinates(offset);
    if (points.size() < MIN_TRACK_DETECTIONS) {
        return events;
    }

    auto pieces = Geometry::SplitLineWithLine(Geometry::Line(points),
                                              Geometry::Line(section_.Coordinates()));
    if (!pieces) {
        return events;
    }

    // Each piece after the first starts at a split point. `next` is the index
    // of the first detection at or after that point: a split on a vertex is the
    // detection itself, a split inside a segment is not a detection.
    const std::vector<Detection>& detections = track.Detections();
    size_t next = (*pieces)[0].Size() - 1;

    for (size_t n = 1; n < pieces->size(); ++n) {
        const Geometry::Line& piece = (*pieces)[n];
        const Coordinate& splitPoint = piece.Coordinates().front();

        PrepareEvent(builder, points[next - 1], points[next]);
        events.push_back(builder.CreateEvent(detections[next]));

        bool splitOnVertex = (points[next] == splitPoint);
        next += piece.Size() - (splitOnVertex ? 1 : 2);
    }
    return events;
}

} // namespace Qi::Traffic::Intersect
