#include <QiTraffic/Intersect/Parallelization.h>
#include <QiTraffic/Core/Validate.h>
#include <QiTraffic/Platform/Thread.h>

#include <algorithm>
#include <functional>
#include <future>
#include <iterator>

namespace Qi::Traffic::Intersect {

namespace {

// Chunks per worker, for load balancing across tracks of uneven length
constexpr size_t CHUNKS_PER_WORKER = 4;

std::vector<Event> RunWorkItems(const IntersectFunction& intersect,
                                const std::vector<IntersectWorkItem>& items) {
    std::vector<Event> events;
    for (const auto& item : items) {
        std::vector<Event> trackEvents = intersect(*item.track, *item.sections);
        events.insert(events.end(), trackEvents.begin(), trackEvents.end());
    }
    return events;
}

void Flatten(std::vector<Event>& target, std::vector<Event>&& part) {
    target.insert(target.end(),
                  std::make_move_iterator(part.begin()),
                  std::make_move_iterator(part.end()));
}

} // anonymous namespace

// =============================================================================
// IntersectParallelizationStrategy
// =============================================================================

IntersectParallelizationStrategy::IntersectParallelizationStrategy(int numWorkers)
    : numWorkers_(numWorkers) {
    Validate::RequireAtLeast(numWorkers, 1, "numWorkers", "IntersectParallelization");
}

void IntersectParallelizationStrategy::SetNumWorkers(int numWorkers) {
    Validate::RequireAtLeast(numWorkers, 1, "numWorkers", "IntersectParallelization");
    numWorkers_ = numWorkers;
}

// =============================================================================
// SequentialIntersectParallelization
// =============================================================================

std::vector<Event> SequentialIntersectParallelization::Execute(
    const IntersectFunction& intersect, const std::vector<Track>& tracks,
    const std::vector<Section>& sections) const {
    std::vector<Event> events;
    for (const auto& track : tracks) {
        Flatten(events, intersect(track, sections));
    }
    return events;
}

// =============================================================================
// ThreadPoolIntersectParallelization
// =============================================================================

ThreadPoolIntersectParallelization::ThreadPoolIntersectParallelization(int numWorkers)
    : IntersectParallelizationStrategy(numWorkers) {
}

std::vector<Event> ThreadPoolIntersectParallelization::Execute(
    const IntersectFunction& intersect, const std::vector<Track>& tracks,
    const std::vector<Section>& sections) const {
    if (tracks.empty()) {
        return {};
    }

    const size_t numWorkers = static_cast<size_t>(NumWorkers());
    std::vector<Platform::IndexRange> chunks =
        Platform::PartitionRange(tracks.size(), numWorkers * CHUNKS_PER_WORKER);

    // Declared before the futures: the pool drains and joins before any
    // exception leaves this function.
    Platform::ThreadPool pool(std::min(numWorkers, chunks.size()));

    std::vector<std::future<std::vector<Event>>> futures;
    futures.reserve(chunks.size());

    for (const auto& chunk : chunks) {
        std::vector<IntersectWorkItem> items;
        items.reserve(chunk.end - chunk.begin);
        for (size_t i = chunk.begin; i < chunk.end; ++i) {
            items.push_back({&tracks[i], &sections});
        }
        futures.push_back(pool.Submit(RunWorkItems, std::cref(intersect), std::move(items)));
    }

    std::vector<Event> events;
    for (auto& future : futures) {
        Flatten(events, future.get());
    }
    return events;
}

} // namespace Qi::Traffic::Intersect
