#pragma once

/**
 * @file RunIntersect.h
 * @brief Intersection pass over all tracks and sections
 *
 * Provides:
 * - IntersectTrack: events of one track for every section (strategy chosen
 *   per section variant)
 * - RunIntersect: IntersectTrack fanned out by a parallelization strategy
 * - CreateEvents: section and scene passes over the repositories, published
 *   to the event repository in one batch
 * - TracksIntersectingSections: ids of tracks touching any section
 */

#include <QiTraffic/Core/Export.h>
#include <QiTraffic/Domain/Event.h>
#include <QiTraffic/Domain/Section.h>
#include <QiTraffic/Domain/Track.h>
#include <QiTraffic/Intersect/AnalysisParams.h>
#include <QiTraffic/Intersect/Parallelization.h>
#include <QiTraffic/Repository/EventRepository.h>
#include <QiTraffic/Repository/SectionRepository.h>
#include <QiTraffic/Repository/TrackRepository.h>

#include <memory>
#include <set>
#include <vector>

namespace Qi::Traffic::Intersect {

/**
 * @brief Events of one track for all sections, grouped by section in order
 *
 * Line sections use `lineStrategy`; areas always use AreaPointsIntersector.
 */
QITRAFFIC_API std::vector<Event> IntersectTrack(
    const Track& track, const std::vector<Section>& sections,
    LineIntersectionStrategy lineStrategy = LineIntersectionStrategy::SmallestSegments);

/**
 * @brief Section pass: IntersectTrack for every track
 *
 * The parallelization strategy is borrowed and must outlive this object.
 */
class QITRAFFIC_API RunIntersect {
public:
    RunIntersect(const IntersectParallelizationStrategy& parallelizer,
                 LineIntersectionStrategy lineStrategy)
        : parallelizer_(parallelizer), lineStrategy_(lineStrategy) {}

    std::vector<Event> operator()(const std::vector<Track>& tracks,
                                  const std::vector<Section>& sections) const;

private:
    const IntersectParallelizationStrategy& parallelizer_;
    LineIntersectionStrategy lineStrategy_;
};

/**
 * @brief Creates all events for the current repository contents
 *
 * Tracks with fewer than two detections are skipped. Once both passes have
 * completed, previous events are cleared and the new events are published in
 * one batch. If a pass throws, the event repository is left untouched.
 */
class QITRAFFIC_API CreateEvents {
public:
    /**
     * @throws InvalidArgumentException if params are invalid
     *
     * Applies params.logLevel to the global log level.
     */
    CreateEvents(const SectionRepository& sections, const TrackRepository& tracks,
                 EventRepository& events, const AnalysisParams& params = AnalysisParams());

    void operator()() const;

private:
    const SectionRepository& sections_;
    const TrackRepository& tracks_;
    EventRepository& events_;
    AnalysisParams params_;
    std::unique_ptr<IntersectParallelizationStrategy> parallelizer_;
};

/**
 * @brief Ids of tracks whose sampled polyline touches any section
 *
 * Sections are used as polylines of their coordinates (an area's ring
 * included). Tracks are sampled with the section's SectionEnter offset.
 */
class QITRAFFIC_API TracksIntersectingSections {
public:
    explicit TracksIntersectingSections(const TrackRepository& tracks) : tracks_(tracks) {}

    /// @throws ConfigurationException if a section lacks the SectionEnter offset
    std::set<TrackId> operator()(const std::vector<Section>& sections) const;

private:
    const TrackRepository& tracks_;
};

} // namespace Qi::Traffic::Intersect
