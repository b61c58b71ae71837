#include <QiTraffic/Domain/Event.h>
#include <QiTraffic/Core/Exception.h>
#include <QiTraffic/Core/Validate.h>

#include <utility>

namespace Qi::Traffic {

// =============================================================================
// Event
// =============================================================================

Event::Event(std::string roadUserId, std::string roadUserType, std::string hostname,
             Timestamp occurrence, int64_t frameNumber, std::optional<SectionId> sectionId,
             Coordinate eventCoordinate, EventType eventType,
             DirectionVector2d directionVector, std::string videoName)
    : roadUserId_(std::move(roadUserId)),
      roadUserType_(std::move(roadUserType)),
      hostname_(std::move(hostname)),
      occurrence_(occurrence),
      frameNumber_(frameNumber),
      sectionId_(std::move(sectionId)),
      eventCoordinate_(eventCoordinate),
      eventType_(eventType),
      directionVector_(directionVector),
      videoName_(std::move(videoName)) {
    Validate::RequireAtLeast(frameNumber_, 1, "frame number", "Event");
}

bool Event::operator==(const Event& other) const {
    return roadUserId_ == other.roadUserId_ &&
           roadUserType_ == other.roadUserType_ &&
           hostname_ == other.hostname_ &&
           occurrence_ == other.occurrence_ &&
           frameNumber_ == other.frameNumber_ &&
           sectionId_ == other.sectionId_ &&
           eventCoordinate_ == other.eventCoordinate_ &&
           eventType_ == other.eventType_ &&
           directionVector_ == other.directionVector_ &&
           videoName_ == other.videoName_;
}

// =============================================================================
// EventBuilder
// =============================================================================

void EventBuilder::Reset() {
    eventType_.reset();
    directionVector_.reset();
    eventCoordinate_.reset();
    roadUserType_.reset();
}

std::string EventBuilder::ExtractHostname(const std::string& videoName) {
    size_t nameStart = videoName.find_last_of("/\\");
    nameStart = (nameStart == std::string::npos) ? 0 : nameStart + 1;

    size_t delimiter = videoName.find('_', nameStart);
    if (delimiter == std::string::npos || delimiter == nameStart) {
        throw ImproperFormattedFilenameException(
            "could not parse hostname from '" + videoName +
            "', expected '<hostname>_<rest>'");
    }
    return videoName.substr(nameStart, delimiter - nameStart);
}

void EventBuilder::RequireCommonFields() const {
    if (!eventType_) {
        throw BuilderSetupException("event type not set");
    }
    if (!directionVector_) {
        throw BuilderSetupException("direction vector not set");
    }
    if (!eventCoordinate_) {
        throw BuilderSetupException("event coordinate not set");
    }
    if (!roadUserType_) {
        throw BuilderSetupException("road user type not set");
    }
}

Event EventBuilder::Stamp(const Detection& detection, std::optional<SectionId> sectionId) const {
    return Event(detection.GetTrackId().Id(),
                 *roadUserType_,
                 ExtractHostname(detection.VideoName()),
                 detection.Occurrence(),
                 detection.Frame(),
                 std::move(sectionId),
                 *eventCoordinate_,
                 *eventType_,
                 *directionVector_,
                 detection.VideoName());
}

// =============================================================================
// SectionEventBuilder
// =============================================================================

Event SectionEventBuilder::CreateEvent(const Detection& detection) const {
    if (!sectionId_) {
        throw BuilderSetupException("section id not set");
    }
    RequireCommonFields();
    return Stamp(detection, sectionId_);
}

void SectionEventBuilder::Reset() {
    EventBuilder::Reset();
    sectionId_.reset();
}

// =============================================================================
// SceneEventBuilder
// =============================================================================

Event SceneEventBuilder::CreateEvent(const Detection& detection) const {
    RequireCommonFields();
    return Stamp(detection, std::nullopt);
}

} // namespace Qi::Traffic
