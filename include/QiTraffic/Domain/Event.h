#pragma once

/**
 * @file Event.h
 * @brief Event records and the builders that stamp them from detections
 *
 * Builder contract:
 * - A builder accumulates per-section fields (section id, event type,
 *   road user type) and per-detection fields (direction vector, event
 *   coordinate).
 * - Set every per-detection field before each CreateEvent() call; values
 *   from the previous detection are otherwise reused.
 * - CreateEvent() throws BuilderSetupException if a required field is unset.
 * - Reset() clears all fields.
 */

#include <QiTraffic/Core/Export.h>
#include <QiTraffic/Core/Types.h>
#include <QiTraffic/Domain/EventType.h>
#include <QiTraffic/Domain/Section.h>
#include <QiTraffic/Domain/Track.h>

#include <cstdint>
#include <optional>
#include <string>

namespace Qi::Traffic {

// =============================================================================
// Event
// =============================================================================

/**
 * @brief Immutable record of a track crossing a section or entering/leaving the scene
 */
class QITRAFFIC_API Event {
public:
    /// @throws InvalidArgumentException if frameNumber < 1
    Event(std::string roadUserId, std::string roadUserType, std::string hostname,
          Timestamp occurrence, int64_t frameNumber, std::optional<SectionId> sectionId,
          Coordinate eventCoordinate, EventType eventType,
          DirectionVector2d directionVector, std::string videoName);

    const std::string& RoadUserId() const { return roadUserId_; }
    const std::string& RoadUserType() const { return roadUserType_; }
    const std::string& Hostname() const { return hostname_; }
    Timestamp Occurrence() const { return occurrence_; }
    int64_t FrameNumber() const { return frameNumber_; }
    const std::optional<SectionId>& GetSectionId() const { return sectionId_; }
    const Coordinate& EventCoordinate() const { return eventCoordinate_; }
    EventType Type() const { return eventType_; }
    const DirectionVector2d& DirectionVector() const { return directionVector_; }
    const std::string& VideoName() const { return videoName_; }

    bool operator==(const Event& other) const;
    bool operator!=(const Event& other) const { return !(*this == other); }

private:
    std::string roadUserId_;
    std::string roadUserType_;
    std::string hostname_;
    Timestamp occurrence_;
    int64_t frameNumber_;
    std::optional<SectionId> sectionId_;
    Coordinate eventCoordinate_;
    EventType eventType_;
    DirectionVector2d directionVector_;
    std::string videoName_;
};

// =============================================================================
// EventBuilder
// =============================================================================

/**
 * @brief Accumulates event fields and stamps events from detections
 */
class QITRAFFIC_API EventBuilder {
public:
    virtual ~EventBuilder() = default;

    void AddEventType(EventType type) { eventType_ = type; }
    void AddDirectionVector(const DirectionVector2d& vector) { directionVector_ = vector; }
    void AddDirectionVector(const Detection& first, const Detection& second) {
        directionVector_ = DirectionVector2d::Between(first.Position(), second.Position());
    }
    void AddEventCoordinate(double x, double y) { eventCoordinate_ = Coordinate(x, y); }
    void AddRoadUserType(const std::string& roadUserType) { roadUserType_ = roadUserType; }

    const std::optional<EventType>& GetEventType() const { return eventType_; }

    /**
     * @brief Create an event anchored at a detection
     * @throws BuilderSetupException if a required field is unset
     * @throws ImproperFormattedFilenameException if the detection's video name
     *         does not carry a hostname
     */
    virtual Event CreateEvent(const Detection& detection) const = 0;

    /// Clear all accumulated fields
    virtual void Reset();

    /**
     * @brief Hostname prefix of a video file name ("<hostname>_<rest>")
     *
     * Directory components are ignored.
     * @throws ImproperFormattedFilenameException if there is no non-empty prefix
     */
    static std::string ExtractHostname(const std::string& videoName);

protected:
    /// @throws BuilderSetupException naming the first missing common field
    void RequireCommonFields() const;

    Event Stamp(const Detection& detection, std::optional<SectionId> sectionId) const;

private:
    std::optional<EventType> eventType_;
    std::optional<DirectionVector2d> directionVector_;
    std::optional<Coordinate> eventCoordinate_;
    std::optional<std::string> roadUserType_;
};

/**
 * @brief Builder for events bound to a section
 */
class QITRAFFIC_API SectionEventBuilder : public EventBuilder {
public:
    void AddSectionId(const SectionId& id) { sectionId_ = id; }

    Event CreateEvent(const Detection& detection) const override;
    void Reset() override;

private:
    std::optional<SectionId> sectionId_;
};

/**
 * @brief Builder for scene boundary events (no section id)
 */
class QITRAFFIC_API SceneEventBuilder : public EventBuilder {
public:
    Event CreateEvent(const Detection& detection) const override;
};

} // namespace Qi::Traffic
