#pragma once

/**
 * @file Track.h
 * @brief Detection and Track value objects and classification strategies
 *
 * Both types validate in their constructors and are immutable afterwards.
 * Cutting a track produces new Track instances (see Cut/CutTracks.h).
 */

#include <QiTraffic/Core/Export.h>
#include <QiTraffic/Core/Types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace Qi::Traffic {

/// Time of a detection's occurrence
using Timestamp = std::chrono::system_clock::time_point;

// =============================================================================
// TrackId
// =============================================================================

/**
 * @brief Identifier of a track
 *
 * Tracks read from a tracker carry positive integer ids; tracks produced by
 * cutting carry synthetic ids of the form "<original>_<n>", so the id is
 * stored as text.
 */
class QITRAFFIC_API TrackId {
public:
    /// @throws InvalidArgumentException if id < 1
    explicit TrackId(int64_t id);

    /// @throws InvalidArgumentException if id is empty
    explicit TrackId(std::string id);

    const std::string& Id() const { return id_; }

    bool operator==(const TrackId& other) const { return id_ == other.id_; }
    bool operator!=(const TrackId& other) const { return id_ != other.id_; }
    bool operator<(const TrackId& other) const { return id_ < other.id_; }

private:
    std::string id_;
};

// =============================================================================
// Detection
// =============================================================================

/**
 * @brief One bounding-box observation (xywh format) of a road user in a frame
 */
class QITRAFFIC_API Detection {
public:
    /**
     * @throws InvalidArgumentException if confidence is outside [0,1], any
     *         bounding box component is negative, or frame < 1
     */
    Detection(std::string classification, double confidence,
              double x, double y, double w, double h,
              int64_t frame, Timestamp occurrence, std::string inputFile,
              bool interpolated, TrackId trackId, std::string videoName);

    const std::string& Classification() const { return classification_; }
    double Confidence() const { return confidence_; }
    double X() const { return x_; }
    double Y() const { return y_; }
    double W() const { return w_; }
    double H() const { return h_; }
    int64_t Frame() const { return frame_; }
    Timestamp Occurrence() const { return occurrence_; }
    const std::string& InputFile() const { return inputFile_; }
    bool Interpolated() const { return interpolated_; }
    const TrackId& GetTrackId() const { return trackId_; }
    const std::string& VideoName() const { return videoName_; }

    /// Top-left corner of the bounding box
    Coordinate Position() const { return {x_, y_}; }

    /// Point inside the bounding box selected by a relative offset
    Coordinate CoordinateAt(const RelativeOffsetCoordinate& offset) const {
        return {x_ + w_ * offset.x, y_ + h_ * offset.y};
    }

    /// Copy of this detection assigned to another track
    Detection WithTrackId(const TrackId& trackId) const;

    bool operator==(const Detection& other) const;
    bool operator!=(const Detection& other) const { return !(*this == other); }

private:
    std::string classification_;
    double confidence_;
    double x_;
    double y_;
    double w_;
    double h_;
    int64_t frame_;
    Timestamp occurrence_;
    std::string inputFile_;
    bool interpolated_;
    TrackId trackId_;
    std::string videoName_;
};

// =============================================================================
// Track
// =============================================================================

/**
 * @brief Time-ordered sequence of detections of one road user
 */
class QITRAFFIC_API Track {
public:
    /**
     * @throws InsufficientDataException if fewer than two detections are given
     * @throws InvalidArgumentException if detections are not sorted by occurrence
     */
    Track(TrackId id, std::string classification, std::vector<Detection> detections);

    const TrackId& Id() const { return id_; }
    const std::string& Classification() const { return classification_; }
    const std::vector<Detection>& Detections() const { return detections_; }
    size_t Size() const { return detections_.size(); }

    const Detection& FirstDetection() const { return detections_.front(); }
    const Detection& LastDetection() const { return detections_.back(); }

    /// Sampled point per detection, in detection order
    std::vector<Coordinate> Coordinates(const RelativeOffsetCoordinate& offset) const;

private:
    TrackId id_;
    std::string classification_;
    std::vector<Detection> detections_;
};

/**
 * @brief Result of cutting tracks with a cutting section
 */
struct CutTracksDto {
    std::string sectionName;                ///< Id of the (retired) cutting section
    std::vector<TrackId> originalTrackIds;  ///< Tracks replaced by their sub-tracks
};

// =============================================================================
// Classification
// =============================================================================

/**
 * @brief Strategy determining a track's classification from its detections
 */
class QITRAFFIC_API TrackClassificationCalculator {
public:
    virtual ~TrackClassificationCalculator() = default;

    /// @throws InvalidArgumentException if detections is empty
    virtual std::string Calculate(const std::vector<Detection>& detections) const = 0;
};

/**
 * @brief Label with the largest summed confidence over all detections
 *
 * Ties are broken lexicographically: the smallest label wins.
 */
class QITRAFFIC_API CalculateTrackClassificationByMaxConfidence
    : public TrackClassificationCalculator {
public:
    std::string Calculate(const std::vector<Detection>& detections) const override;
};

} // namespace Qi::Traffic

namespace std {

template<>
struct hash<Qi::Traffic::TrackId> {
    size_t operator()(const Qi::Traffic::TrackId& id) const noexcept {
        return std::hash<std::string>()(id.Id());
    }
};

} // namespace std
