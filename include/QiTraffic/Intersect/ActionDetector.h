#pragma once

/**
 * @file ActionDetector.h
 * @brief Section and scene event detection over tracks
 */

#include <QiTraffic/Core/Export.h>
#include <QiTraffic/Domain/Event.h>
#include <QiTraffic/Domain/Section.h>
#include <QiTraffic/Domain/Track.h>
#include <QiTraffic/Intersect/Intersector.h>

#include <vector>

namespace Qi::Traffic::Intersect {

// =============================================================================
// SectionActionDetector
// =============================================================================

/**
 * @brief Seeds a section event builder and runs one intersector
 *
 * Holds references to the intersector and builder; both must outlive the
 * detector.
 */
class QITRAFFIC_API SectionActionDetector {
public:
    SectionActionDetector(const Intersector& intersector, SectionEventBuilder& builder)
        : intersector_(intersector), builder_(builder) {}

    /**
     * @brief Events of one track for one section
     *
     * The builder is reset, seeded with the section id and SectionEnter, and
     * handed to the intersector.
     */
    std::vector<Event> Detect(const Section& section, const Track& track) const;

    /**
     * @brief Events of every track for every section, section by section
     *
     * The same intersector is used for all sections.
     */
    std::vector<Event> DetectEnterActions(const std::vector<Section>& sections,
                                          const std::vector<Track>& tracks) const;

private:
    const Intersector& intersector_;
    SectionEventBuilder& builder_;
};

// =============================================================================
// SceneActionDetector
// =============================================================================

/**
 * @brief Emits EnterScene at the first and LeaveScene at the last detection
 *
 * Scene events carry no section id. The event coordinate is the detection
 * position; the direction vector is taken from the first two detections
 * (enter) or the last two detections (leave).
 */
class QITRAFFIC_API SceneActionDetector {
public:
    explicit SceneActionDetector(SceneEventBuilder& builder) : builder_(builder) {}

    Event DetectEnterScene(const Track& track) const;
    Event DetectLeaveScene(const Track& track) const;

    /// EnterScene and LeaveScene for every track, in track order
    std::vector<Event> Detect(const std::vector<Track>& tracks) const;

private:
    SceneEventBuilder& builder_;
};

} // namespace Qi::Traffic::Intersect
