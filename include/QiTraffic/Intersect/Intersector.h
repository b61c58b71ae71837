#pragma once

/**
 * @file Intersector.h
 * @brief Strategies turning a (track, section) pair into crossing events
 *
 * Every strategy samples one point per detection using the section's offset
 * for the event type in use, tests the sampled track against the section
 * geometry, and stamps events through the supplied builder. The builder must
 * already carry the section id; the strategy sets the road user type and all
 * per-event fields.
 *
 * Returned events are ordered by detection occurrence.
 */

#include <QiTraffic/Core/Export.h>
#include <QiTraffic/Domain/Event.h>
#include <QiTraffic/Domain/Section.h>
#include <QiTraffic/Domain/Track.h>

#include <vector>

namespace Qi::Traffic::Intersect {

/**
 * @brief Algorithm interface for one section
 */
class QITRAFFIC_API Intersector {
public:
    virtual ~Intersector() = default;

    /**
     * @brief Compute the events of a track for this intersector's section
     * @throws ConfigurationException if the section lacks the needed offset
     * @throws BuilderSetupException if the builder is not seeded
     */
    virtual std::vector<Event> Intersect(const Track& track, EventBuilder& builder) const = 0;
};

/**
 * @brief Line strategy testing every pair of consecutive detections
 *
 * The whole sampled polyline is tested first; tracks that never touch the
 * line are rejected without walking their segments. Each segment that
 * intersects the line yields one event at its later detection, with the
 * direction vector of the segment. N crossing segments yield N events.
 * Uses the SectionEnter offset.
 */
class QITRAFFIC_API SmallestSegmentsIntersector : public Intersector {
public:
    explicit SmallestSegmentsIntersector(const LineSection& section) : section_(section) {}

    std::vector<Event> Intersect(const Track& track, EventBuilder& builder) const override;

private:
    LineSection section_;
};

/**
 * @brief Area strategy comparing inside/outside state of consecutive points
 *
 * A track starting inside yields a SectionEnter at its first detection. Each
 * later change of state yields SectionEnter (outside to inside) or
 * SectionLeave (inside to outside) at the detection where the change is
 * observed. Points on the boundary count as outside. Uses the SectionEnter
 * offset.
 */
class QITRAFFIC_API AreaPointsIntersector : public Intersector {
public:
    explicit AreaPointsIntersector(const Area& area) : area_(area) {}

    std::vector<Event> Intersect(const Track& track, EventBuilder& builder) const override;

private:
    Area area_;
};

/**
 * @brief Line strategy splitting the sampled polyline at the section line
 *
 * Each split point yields one event at the detection that follows it. The
 * offset is taken for the builder's current event type, which must be set.
 * At touching contacts (a detection exactly on the line) the result can
 * differ from SmallestSegmentsIntersector.
 */
class QITRAFFIC_API SplittingLineIntersector : public Intersector {
public:
    explicit SplittingLineIntersector(const LineSection& section) : section_(section) {}

    std::vector<Event> Intersect(const Track& track, EventBuilder& builder) const override;

private:
    LineSection section_;
};

} // namespace Qi::Traffic::Intersect
