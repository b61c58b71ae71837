#include <QiTraffic/Repository/EventRepository.h>

#include <utility>

namespace Qi::Traffic {

// =============================================================================
// EventRepository
// =============================================================================

void EventRepository::RegisterObserver(EventListObserver observer) {
    observers_.push_back(std::move(observer));
}

void EventRepository::Add(const Event& event) {
    events_.push_back(event);
    Notify({{event}, {}});
}

void EventRepository::AddAll(const std::vector<Event>& events) {
    events_.insert(events_.end(), events.begin(), events.end());
    Notify({events, {}});
}

void EventRepository::Clear() {
    EventRepositoryEvent event;
    event.removed.swap(events_);
    Notify(event);
}

void EventRepository::Notify(const EventRepositoryEvent& event) const {
    for (const auto& observer : observers_) {
        observer(event);
    }
}

// =============================================================================
// Use Cases
// =============================================================================

void AddEvents::operator()(const std::vector<Event>& events) const {
    if (!events.empty()) {
        repository_.AddAll(events);
    }
}

void ClearAllEvents::Clear() const {
    repository_.Clear();
}

void ClearAllEvents::OnSectionsChanged(const std::vector<SectionId>&) const {
    Clear();
}

void ClearAllEvents::OnSectionChanged(const SectionId&) const {
    Clear();
}

void ClearAllEvents::OnTracksChanged(const TrackRepositoryEvent&) const {
    Clear();
}

void ClearAllEvents::OnTracksCut(const CutTracksDto&) const {
    Clear();
}

} // namespace Qi::Traffic
