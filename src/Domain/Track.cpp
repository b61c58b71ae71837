#include <QiTraffic/Domain/Track.h>
#include <QiTraffic/Core/Constants.h>
#include <QiTraffic/Core/Exception.h>
#include <QiTraffic/Core/Validate.h>

#include <algorithm>
#include <map>
#include <utility>

namespace Qi::Traffic {

// =============================================================================
// TrackId
// =============================================================================

TrackId::TrackId(int64_t id) {
    Validate::RequireAtLeast(id, 1, "id", "TrackId");
    id_ = std::to_string(id);
}

TrackId::TrackId(std::string id) : id_(std::move(id)) {
    if (id_.empty()) {
        throw InvalidArgumentException("TrackId: id must not be empty");
    }
}

// =============================================================================
// Detection
// =============================================================================

Detection::Detection(std::string classification, double confidence,
                     double x, double y, double w, double h,
                     int64_t frame, Timestamp occurrence, std::string inputFile,
                     bool interpolated, TrackId trackId, std::string videoName)
    : classification_(std::move(classification)),
      confidence_(confidence),
      x_(x), y_(y), w_(w), h_(h),
      frame_(frame),
      occurrence_(occurrence),
      inputFile_(std::move(inputFile)),
      interpolated_(interpolated),
      trackId_(std::move(trackId)),
      videoName_(std::move(videoName)) {
    Validate::RequireInRange(confidence_, 0.0, 1.0, "confidence", "Detection");
    Validate::RequireNonNegative(x_, "x", "Detection");
    Validate::RequireNonNegative(y_, "y", "Detection");
    Validate::RequireNonNegative(w_, "w", "Detection");
    Validate::RequireNonNegative(h_, "h", "Detection");
    Validate::RequireAtLeast(frame_, 1, "frame", "Detection");
}

Detection Detection::WithTrackId(const TrackId& trackId) const {
    Detection copy(*this);
    copy.trackId_ = trackId;
    return copy;
}

bool Detection::operator==(const Detection& other) const {
    return classification_ == other.classification_ &&
           confidence_ == other.confidence_ &&
           x_ == other.x_ && y_ == other.y_ && w_ == other.w_ && h_ == other.h_ &&
           frame_ == other.frame_ &&
           occurrence_ == other.occurrence_ &&
           inputFile_ == other.inputFile_ &&
           interpolated_ == other.interpolated_ &&
           trackId_ == other.trackId_ &&
           videoName_ == other.videoName_;
}

// =============================================================================
// Track
// =============================================================================

Track::Track(TrackId id, std::string classification, std::vector<Detection> detections)
    : id_(std::move(id)),
      classification_(std::move(classification)),
      detections_(std::move(detections)) {
    if (detections_.size() < MIN_TRACK_DETECTIONS) {
        throw InsufficientDataException(
            "Trying to construct track (track_id=" + id_.Id() +
            ") with less than two detections.");
    }

    bool sorted = std::is_sorted(detections_.begin(), detections_.end(),
        [](const Detection& a, const Detection& b) {
            return a.Occurrence() < b.Occurrence();
        });
    if (!sorted) {
        throw InvalidArgumentException(
            "Track " + id_.Id() + ": detections must be sorted by occurrence");
    }
}

std::vector<Coordinate> Track::Coordinates(const RelativeOffsetCoordinate& offset) const {
    std::vector<Coordinate> coordinates;
    coordinates.reserve(detections_.size());
    for (const auto& detection : detections_) {
        coordinates.push_back(detection.CoordinateAt(offset));
    }
    return coordinates;
}

// =============================================================================
// Classification
// =============================================================================

std::string CalculateTrackClassificationByMaxConfidence::Calculate(
    const std::vector<Detection>& detections) const {
    if (detections.empty()) {
        throw InvalidArgumentException(
            "CalculateTrackClassificationByMaxConfidence: no detections");
    }

    // Ordered map: iteration is lexicographic, so the first maximum is the
    // smallest label among equal sums
    std::map<std::string, double> confidenceSums;
    for (const auto& detection : detections) {
        confidenceSums[detection.Classification()] += detection.Confidence();
    }

    auto best = confidenceSums.begin();
    for (auto it = confidenceSums.begin(); it != confidenceSums.end(); ++it) {
        if (it->second > best->second) {
            best = it;
        }
    }
    return best->first;
}

} // namespace Qi::Traffic
