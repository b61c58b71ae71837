#pragma once

/**
 * @file Parallelization.h
 * @brief Fan-out of the per-track intersection work
 *
 * Execution contract:
 * - The intersect function is called once per track with the shared,
 *   read-only section list.
 * - The result is the concatenation of the per-track event lists; each
 *   track's events keep their order.
 * - An exception thrown for any track aborts the pass and is rethrown from
 *   Execute(); no partial result is returned.
 */

#include <QiTraffic/Core/Export.h>
#include <QiTraffic/Domain/Event.h>
#include <QiTraffic/Domain/Section.h>
#include <QiTraffic/Domain/Track.h>

#include <atomic>
#include <functional>
#include <vector>

namespace Qi::Traffic::Intersect {

/// Per-track work: events of one track for all sections
using IntersectFunction =
    std::function<std::vector<Event>(const Track&, const std::vector<Section>&)>;

/**
 * @brief One unit of work handed to a worker
 */
struct IntersectWorkItem {
    const Track* track = nullptr;
    const std::vector<Section>* sections = nullptr;
};

/**
 * @brief Strategy interface for running IntersectFunction over many tracks
 */
class QITRAFFIC_API IntersectParallelizationStrategy {
public:
    virtual ~IntersectParallelizationStrategy() = default;

    virtual std::vector<Event> Execute(const IntersectFunction& intersect,
                                       const std::vector<Track>& tracks,
                                       const std::vector<Section>& sections) const = 0;

    int NumWorkers() const { return numWorkers_; }

    /**
     * @brief Change the worker count used by later Execute() calls
     * @throws InvalidArgumentException if numWorkers < 1
     */
    void SetNumWorkers(int numWorkers);

protected:
    /// @throws InvalidArgumentException if numWorkers < 1
    explicit IntersectParallelizationStrategy(int numWorkers);

private:
    std::atomic<int> numWorkers_;
};

/**
 * @brief Runs all tracks on the calling thread, in track order
 */
class QITRAFFIC_API SequentialIntersectParallelization : public IntersectParallelizationStrategy {
public:
    SequentialIntersectParallelization() : IntersectParallelizationStrategy(1) {}

    std::vector<Event> Execute(const IntersectFunction& intersect,
                               const std::vector<Track>& tracks,
                               const std::vector<Section>& sections) const override;
};

/**
 * @brief Partitions the tracks into chunks processed by a thread pool
 *
 * Each Execute() call creates its own pool with NumWorkers() threads, so
 * changing the worker count never affects a pass in flight. Events are
 * returned grouped by track; the order of tracks in the result is not part
 * of the contract.
 */
class QITRAFFIC_API ThreadPoolIntersectParallelization : public IntersectParallelizationStrategy {
public:
    /// @throws InvalidArgumentException if numWorkers < 1
    explicit ThreadPoolIntersectParallelization(int numWorkers);

    std::vector<Event> Execute(const IntersectFunction& intersect,
                               const std::vector<Track>& tracks,
                               const std::vector<Section>& sections) const override;
};

} // namespace Qi::Traffic::Intersect
