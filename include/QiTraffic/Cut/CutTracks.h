#pragma once

/**
 * @file CutTracks.h
 * @brief Splitting tracks into sub-tracks at a cutting section
 *
 * A track is walked pair by pair. Whenever the segment between two
 * consecutive detections intersects the cutting line, the sub-track in
 * progress is closed at the earlier detection and a new one starts with the
 * later detection. Sub-tracks are named "<original id>_<n>" with n counting
 * from 1, and their classification is recomputed from their own detections.
 *
 * Cutting uses the raw detection positions (bounding box top-left), not a
 * section offset.
 */

#include <QiTraffic/Core/Export.h>
#include <QiTraffic/Domain/Section.h>
#include <QiTraffic/Domain/Track.h>
#include <QiTraffic/Intersect/RunIntersect.h>
#include <QiTraffic/Repository/SectionRepository.h>
#include <QiTraffic/Repository/TrackRepository.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Qi::Traffic::Cut {

// =============================================================================
// CutTrackSegmentBuilder
// =============================================================================

/**
 * @brief Reusable builder for sub-tracks
 *
 * Detections are re-assigned to the sub-track id. The builder resets after
 * every successful Build().
 */
class QITRAFFIC_API CutTrackSegmentBuilder {
public:
    /// The calculator is borrowed and must outlive the builder
    explicit CutTrackSegmentBuilder(const TrackClassificationCalculator& calculator)
        : calculator_(calculator) {}

    /// @throws InvalidArgumentException if id is empty
    void AddId(const std::string& id);

    void AddDetection(const Detection& detection);

    /**
     * @brief Build the sub-track from the accumulated detections
     * @throws BuilderSetupException if no id was added
     * @throws InsufficientDataException if fewer than two detections were added
     */
    Track Build();

    void Reset();

    size_t DetectionCount() const { return detections_.size(); }

private:
    const TrackClassificationCalculator& calculator_;
    std::optional<TrackId> trackId_;
    std::vector<Detection> detections_;
};

// =============================================================================
// CutTracksWithSection
// =============================================================================

/**
 * @brief Cuts tracks with the polyline of a cutting section
 */
class QITRAFFIC_API CutTracksWithSection {
public:
    /// The builder is borrowed and must outlive this object
    explicit CutTracksWithSection(CutTrackSegmentBuilder& builder) : builder_(builder) {}

    /**
     * @brief Sub-tracks of all given tracks, in track order
     * @throws InsufficientDataException if a sub-track would have fewer than
     *         two detections
     */
    std::vector<Track> operator()(const std::vector<Track>& tracks,
                                  const LineSection& cuttingSection) const;

    /// Sub-tracks of one track; a track that is never crossed yields one copy
    std::vector<Track> CutTrack(const Track& track, const LineSection& cuttingSection) const;

private:
    Track BuildSegment(const std::string& id, const Detection& closingDetection) const;

    CutTrackSegmentBuilder& builder_;
};

// =============================================================================
// CutTracksIntersectingSection
// =============================================================================

using TracksCutObserver = std::function<void(const CutTracksDto&)>;

/**
 * @brief Replaces every track crossing a cutting section by its sub-tracks
 *
 * All sub-tracks are built before a repository is touched, so a failing cut
 * leaves both repositories unchanged. On success the original tracks and the
 * cutting section are removed, the sub-tracks are added, and observers are
 * notified with the result.
 */
class QITRAFFIC_API CutTracksIntersectingSection {
public:
    CutTracksIntersectingSection(SectionRepository& sections, TrackRepository& tracks,
                                 const CutTracksWithSection& cutTracks)
        : sections_(sections), tracks_(tracks), cutTracks_(cutTracks) {}

    void RegisterObserver(TracksCutObserver observer);

    CutTracksDto operator()(const LineSection& cuttingSection) const;

private:
    SectionRepository& sections_;
    TrackRepository& tracks_;
    const CutTracksWithSection& cutTracks_;
    std::vector<TracksCutObserver> observers_;
};

} // namespace Qi::Traffic::Cut
