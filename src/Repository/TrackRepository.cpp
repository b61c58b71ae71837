#include <QiTraffic/Repository/TrackRepository.h>
#include <QiTraffic/Core/Constants.h>
#include <QiTraffic/Core/Exception.h>

#include <utility>

namespace Qi::Traffic {

void TrackRepository::RegisterTracksObserver(TrackListObserver observer) {
    observers_.push_back(std::move(observer));
}

void TrackRepository::Add(const Track& track) {
    tracks_.insert_or_assign(track.Id(), track);
    Notify({{track.Id()}, {}});
}

void TrackRepository::AddAll(const std::vector<Track>& tracks) {
    if (tracks.empty()) {
        return;
    }
    TrackRepositoryEvent event;
    event.added.reserve(tracks.size());
    for (const auto& track : tracks) {
        tracks_.insert_or_assign(track.Id(), track);
        event.added.push_back(track.Id());
    }
    Notify(event);
}

std::optional<Track> TrackRepository::GetFor(const TrackId& id) const {
    auto it = tracks_.find(id);
    if (it == tracks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Track> TrackRepository::GetAll() const {
    std::vector<Track> result;
    result.reserve(tracks_.size());
    for (const auto& [id, track] : tracks_) {
        result.push_back(track);
    }
    return result;
}

std::vector<Track> TrackRepository::GetTracksWithoutSingleDetections() const {
    std::vector<Track> result;
    result.reserve(tracks_.size());
    for (const auto& [id, track] : tracks_) {
        if (track.Size() >= MIN_TRACK_DETECTIONS) {
            result.push_back(track);
        }
    }
    return result;
}

std::vector<Track> TrackRepository::GetTracksFromIds(const std::vector<TrackId>& ids) const {
    std::vector<Track> result;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        auto it = tracks_.find(id);
        if (it != tracks_.end()) {
            result.push_back(it->second);
        }
    }
    return result;
}

void TrackRepository::RemoveMultiple(const std::vector<TrackId>& ids) {
    for (const auto& id : ids) {
        if (tracks_.count(id) == 0) {
            throw NotFoundException("track '" + id.Id() + "' is not in the repository");
        }
    }
    if (ids.empty()) {
        return;
    }
    for (const auto& id : ids) {
        tracks_.erase(id);
    }
    Notify({{}, ids});
}

void TrackRepository::Clear() {
    if (tracks_.empty()) {
        return;
    }
    TrackRepositoryEvent event;
    event.removed.reserve(tracks_.size());
    for (const auto& [id, track] : tracks_) {
        event.removed.push_back(id);
    }
    tracks_.clear();
    Notify(event);
}

void TrackRepository::Notify(const TrackRepositoryEvent& event) const {
    for (const auto& observer : observers_) {
        observer(event);
    }
}

} // namespace Qi::Traffic
