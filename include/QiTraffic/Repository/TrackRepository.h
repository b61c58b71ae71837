#pragma once

/**
 * @file TrackRepository.h
 * @brief In-memory store of tracks with change notification
 */

#include <QiTraffic/Core/Export.h>
#include <QiTraffic/Domain/Track.h>

#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace Qi::Traffic {

/**
 * @brief Ids added to and removed from a TrackRepository by one operation
 */
struct TrackRepositoryEvent {
    std::vector<TrackId> added;
    std::vector<TrackId> removed;
};

using TrackListObserver = std::function<void(const TrackRepositoryEvent&)>;

/**
 * @brief Owns the canonical track collection
 *
 * Tracks are kept ordered by id. Adding a track whose id is already present
 * replaces the stored track.
 */
class QITRAFFIC_API TrackRepository {
public:
    TrackRepository() = default;

    void RegisterTracksObserver(TrackListObserver observer);

    void Add(const Track& track);

    /// Add several tracks; observers are notified once
    void AddAll(const std::vector<Track>& tracks);

    std::optional<Track> GetFor(const TrackId& id) const;

    std::vector<Track> GetAll() const;

    /// Tracks with at least two detections
    std::vector<Track> GetTracksWithoutSingleDetections() const;

    /// Tracks for the given ids, in the given order; unknown ids are skipped
    std::vector<Track> GetTracksFromIds(const std::vector<TrackId>& ids) const;

    /**
     * @brief Remove several tracks; observers are notified once
     * @throws NotFoundException if any id is unknown (nothing is removed)
     */
    void RemoveMultiple(const std::vector<TrackId>& ids);

    /// Remove all tracks
    void Clear();

    size_t Size() const { return tracks_.size(); }
    bool IsEmpty() const { return tracks_.empty(); }

private:
    void Notify(const TrackRepositoryEvent& event) const;

    std::map<TrackId, Track> tracks_;
    std::vector<TrackListObserver> observers_;
};

} // namespace Qi::Traffic
