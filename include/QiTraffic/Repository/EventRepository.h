#pragma once

/**
 * @file EventRepository.h
 * @brief Event sink of the engine and the use cases that feed and clear it
 */

#include <QiTraffic/Core/Export.h>
#include <QiTraffic/Domain/Event.h>
#include <QiTraffic/Repository/TrackRepository.h>

#include <functional>
#include <vector>

namespace Qi::Traffic {

/**
 * @brief Events added to and removed from an EventRepository by one operation
 */
struct EventRepositoryEvent {
    std::vector<Event> added;
    std::vector<Event> removed;
};

using EventListObserver = std::function<void(const EventRepositoryEvent&)>;

/**
 * @brief Owns all events produced by the intersection pass
 */
class QITRAFFIC_API EventRepository {
public:
    EventRepository() = default;

    void RegisterObserver(EventListObserver observer);

    void Add(const Event& event);

    /// Append a batch; observers are notified once with the whole batch
    void AddAll(const std::vector<Event>& events);

    const std::vector<Event>& GetAll() const { return events_; }

    /// Remove all events; observers receive them as removed
    void Clear();

    bool IsEmpty() const { return events_.empty(); }
    size_t Size() const { return events_.size(); }

private:
    void Notify(const EventRepositoryEvent& event) const;

    std::vector<Event> events_;
    std::vector<EventListObserver> observers_;
};

// =============================================================================
// Use Cases
// =============================================================================

/**
 * @brief Publish a batch of events; an empty batch is ignored
 */
class QITRAFFIC_API AddEvents {
public:
    explicit AddEvents(EventRepository& repository) : repository_(repository) {}

    void operator()(const std::vector<Event>& events) const;

private:
    EventRepository& repository_;
};

/**
 * @brief Clears the event repository whenever its inputs become stale
 *
 * Register the On* callbacks with the track and section repositories (or
 * call them directly). The callbacks keep a reference to this object, which
 * must outlive the repositories it is registered with.
 */
class QITRAFFIC_API ClearAllEvents {
public:
    explicit ClearAllEvents(EventRepository& repository) : repository_(repository) {}

    void operator()() const { Clear(); }
    void Clear() const;

    void OnSectionsChanged(const std::vector<SectionId>& sections) const;
    void OnSectionChanged(const SectionId& section) const;
    void OnTracksChanged(const TrackRepositoryEvent& event) const;
    void OnTracksCut(const CutTracksDto& result) const;

private:
    EventRepository& repository_;
};

} // namespace Qi::Traffic
