#include <QiTraffic/Intersect/ActionDetector.h>

namespace Qi::Traffic::Intersect {

// =============================================================================
// SectionActionDetector
// =============================================================================

std::vector<Event> SectionActionDetector::Detect(const Section& section,
                                                 const Track& track) const {
    builder_.Reset();
    builder_.AddSectionId(GetSectionId(section));
    builder_.AddEventType(EventType::SectionEnter);
    return intersector_.Intersect(track, builder_);
}

std::vector<Event> SectionActionDetector::DetectEnterActions(
    const std::vector<Section>& sections, const std::vector<Track>& tracks) const {
    std::vector<Event> events;
    for (const auto& section : sections) {
        for (const auto& track : tracks) {
            std::vector<Event> trackEvents = Detect(section, track);
            events.insert(events.end(), trackEvents.begin(), trackEvents.end());
        }
    }
    return events;
}

// =============================================================================
// SceneActionDetector
// =============================================================================

Event SceneActionDetector::DetectEnterScene(const Track& track) const {
    const std::vector<Detection>& detections = track.Detections();
    const Detection& first = detections[0];

    builder_.Reset();
    builder_.AddEventType(EventType::EnterScene);
    builder_.AddRoadUserType(track.Classification());
    builder_.AddDirectionVector(first, detections[1]);
    builder_.AddEventCoordinate(first.X(), first.Y());
    return builder_.CreateEvent(first);
}

Event SceneActionDetector::DetectLeaveScene(const Track& track) const {
    const std::vector<Detection>& detections = track.Detections();
    const Detection& last = detections.back();

    builder_.Reset();
    builder_.AddEventType(EventType::LeaveScene);
    builder_.AddRoadUserType(track.Classification());
    builder_.AddDirectionVector(detections[detections.size() - 2], last);
    builder_.AddEventCoordinate(last.X(), last.Y());
    return builder_.CreateEvent(last);
}

std::vector<Event> SceneActionDetector::Detect(const std::vector<Track>& tracks) const {
    std::vector<Event> events;
    events.reserve(tracks.size() * 2);
    for (const auto& track : tracks) {
        events.push_back(DetectEnterScene(track));
        events.push_back(DetectLeaveScene(track));
    }
    return events;
}

} // namespace Qi::Traffic::Intersect
