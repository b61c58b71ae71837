#include <QiTraffic/Cut/CutTracks.h>
#include <QiTraffic/Core/Constants.h>
#include <QiTraffic/Core/Exception.h>
#include <QiTraffic/Geometry/Geometry.h>
#include <QiTraffic/Platform/Log.h>
#include <QiTraffic/Platform/Timer.h>

#include <set>
#include <utility>

namespace Qi::Traffic::Cut {

// =============================================================================
// CutTrackSegmentBuilder
// =============================================================================

void CutTrackSegmentBuilder::AddId(const std::string& id) {
    trackId_ = TrackId(id);
}

void CutTrackSegmentBuilder::AddDetection(const Detection& detection) {
    detections_.push_back(detection);
}

Track CutTrackSegmentBuilder::Build() {
    if (!trackId_) {
        throw BuilderSetupException("track id not set");
    }

    std::vector<Detection> detections;
    detections.reserve(detections_.size());
    for (const auto& detection : detections_) {
        detections.push_back(detection.WithTrackId(*trackId_));
    }

    if (detections.size() < MIN_TRACK_DETECTIONS) {
        throw InsufficientDataException("track '" + trackId_->Id() + "' has " +
                                        std::to_string(detections.size()) +
                                        " detection(s), needs at least 2");
    }

    std::string classification = calculator_.Calculate(detections);
    Track result(*trackId_, std::move(classification), std::move(detections));
    Reset();
    return result;
}

void CutTrackSegmentBuilder::Reset() {
    trackId_.reset();
    detections_.clear();
}

// =============================================================================
// CutTracksWithSection
// =============================================================================

std::vector<Track> CutTracksWithSection::operator()(const std::vector<Track>& tracks,
                                                    const LineSection& cuttingSection) const {
    std::vector<Track> result;
    for (const auto& track : tracks) {
        std::vector<Track> segments = CutTrack(track, cuttingSection);
        Platform::LogDebug("Cut track '%s' into %zu tracks",
                           track.Id().Id().c_str(), segments.size());
        result.insert(result.end(), segments.begin(), segments.end());
    }
    return result;
}

std::vector<Track> CutTracksWithSection::CutTrack(const Track& track,
                                                  const LineSection& cuttingSection) const {
    const std::vector<Detection>& detections = track.Detections();
    const std::string& originalId = track.Id().Id();
    Geometry::Line cuttingLine(cuttingSection.Coordinates());

    // A previous failure may have left detections behind
    builder_.Reset();

    std::vector<Track> segments;
    for (size_t i = 0; i + 1 < detections.size(); ++i) {
        const Detection& current = detections[i];
        Geometry::Line segment({current.Position(), detections[i + 1].Position()});

        if (Geometry::LineIntersectsLine(segment, cuttingLine)) {
            segments.push_back(BuildSegment(
                originalId + "_" + std::to_string(segments.size() + 1), current));
        } else {
            builder_.AddDetection(current);
        }
    }

    segments.push_back(BuildSegment(
        originalId + "_" + std::to_string(segments.size() + 1), track.LastDetection()));
    return segments;
}

Track CutTracksWithSection::BuildSegment(const std::string& id,
                                         const Detection& closingDetection) const {
    builder_.AddId(id);
    builder_.AddDetection(closingDetection);
    return builder_.Build();
}

// =============================================================================
// CutTracksIntersectingSection
// =============================================================================

void CutTracksIntersectingSection::RegisterObserver(TracksCutObserver observer) {
    observers_.push_back(std::move(observer));
}

CutTracksDto CutTracksIntersectingSection::operator()(const LineSection& cuttingSection) const {
    Platform::ScopedLogTimer scope("Cutting with section '" + cuttingSection.Id().Id() + "'");

    std::set<TrackId> intersecting =
        Intersect::TracksIntersectingSections(tracks_)({Section(cuttingSection)});

    CutTracksDto result;
    result.sectionName = cuttingSection.Id().Id();
    result.originalTrackIds.assign(intersecting.begin(), intersecting.end());

    std::vector<Track> cutTracks =
        cutTracks_(tracks_.GetTracksFromIds(result.originalTrackIds), cuttingSection);

    tracks_.RemoveMultiple(result.originalTrackIds);
    if (sections_.Contains(cuttingSection.Id())) {
        sections_.Remove(cuttingSection.Id());
    }
    tracks_.AddAll(cutTracks);

    Platform::LogInfo("Cut %zu tracks with section '%s' into %zu tracks",
                      result.originalTrackIds.size(), result.sectionName.c_str(),
                      cutTracks.size());

    for (const auto& observer : observers_) {
        observer(result);
    }
    return result;
}

} // namespace Qi::Traffic::Cut
