#include <QiTraffic/Intersect/RunIntersect.h>
#include <QiTraffic/Geometry/Geometry.h>
#include <QiTraffic/Intersect/ActionDetector.h>
#include <QiTraffic/Intersect/Intersector.h>
#include <QiTraffic/Platform/Log.h>
#include <QiTraffic/Platform/Timer.h>

namespace Qi::Traffic::Intersect {

namespace {

// Selects the strategy for a section variant and runs it for one track
struct SectionIntersectVisitor {
    const Track& track;
    LineIntersectionStrategy lineStrategy;

    std::vector<Event> operator()(const LineSection& line) const {
        if (lineStrategy == LineIntersectionStrategy::SplittingLine) {
            return Run(SplittingLineIntersector(line), line.Id());
        }
        return Run(SmallestSegmentsIntersector(line), line.Id());
    }

    std::vector<Event> operator()(const Area& area) const {
        return Run(AreaPointsIntersector(area), area.Id());
    }

    std::vector<Event> Run(const Intersector& intersector, const SectionId& id) const {
        SectionEventBuilder builder;
        builder.AddSectionId(id);
        builder.AddEventType(EventType::SectionEnter);
        return intersector.Intersect(track, builder);
    }
};

} // anonymous namespace

std::vector<Event> IntersectTrack(const Track& track, const std::vector<Section>& sections,
                                  LineIntersectionStrategy lineStrategy) {
    std::vector<Event> events;
    for (const auto& section : sections) {
        std::vector<Event> sectionEvents =
            std::visit(SectionIntersectVisitor{track, lineStrategy}, section);
        events.insert(events.end(), sectionEvents.begin(), sectionEvents.end());
    }
    return events;
}

// =============================================================================
// RunIntersect
// =============================================================================

std::vector<Event> RunIntersect::operator()(const std::vector<Track>& tracks,
                                            const std::vector<Section>& sections) const {
    const LineIntersectionStrategy strategy = lineStrategy_;
    return parallelizer_.Execute(
        [strategy](const Track& track, const std::vector<Section>& trackSections) {
            return IntersectTrack(track, trackSections, strategy);
        },
        tracks, sections);
}

// =============================================================================
// CreateEvents
// =============================================================================

CreateEvents::CreateEvents(const SectionRepository& sections, const TrackRepository& tracks,
                           EventRepository& events, const AnalysisParams& params)
    : sections_(sections), tracks_(tracks), events_(events), params_(params) {
    params_.Validate();
    Platform::SetLogLevel(params_.logLevel);

    if (params_.parallel) {
        parallelizer_ = std::make_unique<ThreadPoolIntersectParallelization>(params_.numWorkers);
    } else {
        parallelizer_ = std::make_unique<SequentialIntersectParallelization>();
    }
}

void CreateEvents::operator()() const {
    const std::vector<Section>& sections = sections_.GetAll();
    std::vector<Track> tracks = tracks_.GetTracksWithoutSingleDetections();

    Platform::LogInfo("Creating events for %zu tracks and %zu sections (%s, %d workers)",
                      tracks.size(), sections.size(),
                      LineIntersectionStrategyName(params_.lineStrategy),
                      parallelizer_->NumWorkers());
    Platform::Timer timer(true);

    std::vector<Event> events = RunIntersect(*parallelizer_, params_.lineStrategy)(tracks, sections);
    const size_t sectionEventCount = events.size();

    SceneEventBuilder sceneBuilder;
    std::vector<Event> sceneEvents = SceneActionDetector(sceneBuilder).Detect(tracks);
    events.insert(events.end(), sceneEvents.begin(), sceneEvents.end());

    ClearAllEvents{events_}();
    AddEvents{events_}(events);

    Platform::LogInfo("Created %zu section events and %zu scene events in %.1f ms",
                      sectionEventCount, sceneEvents.size(), timer.ElapsedMs());
}

// =============================================================================
// TracksIntersectingSections
// =============================================================================

std::set<TrackId> TracksIntersectingSections::operator()(
    const std::vector<Section>& sections) const {
    std::vector<Track> tracks = tracks_.GetTracksWithoutSingleDetections();
    std::set<TrackId> allIds;

    Platform::LogInfo("Number of intersecting tracks per section");
    for (const auto& section : sections) {
        const RelativeOffsetCoordinate& offset =
            AsBase(section).GetOffset(EventType::SectionEnter);
        Geometry::Line sectionLine(GetCoordinates(section));

        size_t count = 0;
        for (const auto& track : tracks) {
            if (Geometry::LineIntersectsLine(Geometry::Line(track.Coordinates(offset)),
                                             sectionLine)) {
                allIds.insert(track.Id());
                ++count;
            }
        }
        Platform::LogInfo("%s: %zu tracks", GetSectionId(section).Id().c_str(), count);
    }
    Platform::LogInfo("All sections: %zu tracks", allIds.size());
    return allIds;
}

} // namespace Qi::Traffic::Intersect
