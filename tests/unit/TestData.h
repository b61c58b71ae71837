#pragma once

/**
 * @file TestData.h
 * @brief Factories for detections, tracks and sections shared by unit tests
 *
 * Detections have a zero-size bounding box, so every offset samples the
 * detection position itself. Detection i of a track gets frame i + 1 and
 * occurrence Epoch() + i seconds.
 */

#include <QiTraffic/Domain/Section.h>
#include <QiTraffic/Domain/Track.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace Qi::Traffic::TestData {

constexpr const char* VIDEO_NAME = "myhostname_2023-01-01_08-00-00.mp4";

inline Timestamp Epoch() {
    return Timestamp(std::chrono::seconds(1672560000));
}

inline Detection MakeDetection(double x, double y, int64_t index,
                               const std::string& trackId = "1",
                               const std::string& classification = "car",
                               double confidence = 0.9) {
    return Detection(classification, confidence, x, y, 0.0, 0.0,
                     index + 1, Epoch() + std::chrono::seconds(index),
                     "myhostname_2023-01-01_08-00-00.ottrk", false,
                     TrackId(trackId), VIDEO_NAME);
}

inline std::vector<Detection> MakeDetections(const std::vector<Coordinate>& points,
                                             const std::string& trackId = "1",
                                             const std::string& classification = "car") {
    std::vector<Detection> detections;
    detections.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        detections.push_back(MakeDetection(points[i].x, points[i].y,
                                           static_cast<int64_t>(i), trackId, classification));
    }
    return detections;
}

inline Track MakeTrack(const std::string& id, const std::vector<Coordinate>& points,
                       const std::string& classification = "car") {
    return Track(TrackId(id), classification, MakeDetections(points, id, classification));
}

inline RelativeOffsets EnterOffset(double x = 0.0, double y = 0.0) {
    return {{EventType::SectionEnter, RelativeOffsetCoordinate(x, y)}};
}

inline LineSection MakeLine(const std::string& id, Coordinate start, Coordinate end) {
    return LineSection(SectionId(id), EnterOffset(), {}, start, end);
}

inline Area MakeArea(const std::string& id, std::vector<Coordinate> ring) {
    return Area(SectionId(id), EnterOffset(), {}, std::move(ring));
}

/// Square [(0,0),(0,10),(10,10),(10,0),(0,0)]
inline Area MakeSquareArea(const std::string& id = "A") {
    return MakeArea(id, {{0, 0}, {0, 10}, {10, 10}, {10, 0}, {0, 0}});
}

} // namespace Qi::Traffic::TestData
