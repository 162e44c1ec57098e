#pragma once

#include "core/Clock.h"
#include "core/Config.h"
#include "input/CoordinateCache.h"
#include "input/EventPool.h"
#include "input/FrameBatcher.h"
#include "terminal/MouseEvent.h"
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace TerminalMouse::Input {

struct OptimizerMetrics {
    std::size_t totalEvents = 0;
    std::size_t processedEvents = 0;
    std::size_t droppedEvents = 0;
    std::size_t deduplicatedEvents = 0;   // Dropped by the dedup stage (includes stale timestamps)
    std::size_t throttledEvents = 0;      // Dropped by the throttling stage
    std::size_t batchesFlushed = 0;
    std::size_t pooledEvents = 0;         // Acquisitions served from the pool's free list
    std::size_t heapEvents = 0;           // Acquisitions that allocated
    double averageProcessingTimeMs = 0.0;
    double peakProcessingTimeMs = 0.0;
    double cacheHitRate = 0.0;
    double throttlingRate = 0.0;          // droppedEvents / totalEvents
};

/**
 * @brief Reduces a raw mouse event stream to the events worth delivering
 *
 * Stages, in order:
 * 1. Deduplication: a Move at the same cell as the last accepted Move, or
 *    any other event within dedupeIntervalMs of the last accepted event of
 *    its type, is dropped. Events older than the last accepted event of
 *    their type are always dropped.
 * 2. Throttling: Move closer than moveThrottleMs and Drag closer than
 *    dragThrottleMs to the previous accepted event of that type are dropped.
 * 3. Coordinate canonicalisation through a CoordinateCache.
 * 4. Copy into a PooledEvent drawn from an EventPool.
 * 5. Optional frame batching; a returned empty batch then means "queued",
 *    and the events arrive later from Tick() or Flush().
 */
class EventOptimizer {
public:
    explicit EventOptimizer(const Core::OptimizerConfig& config = {},
                            const Core::IClock& clock = Core::SteadyClock::Instance());
    ~EventOptimizer();

    EventOptimizer(const EventOptimizer&) = delete;
    EventOptimizer& operator=(const EventOptimizer&) = delete;

    EventBatch Optimize(const Terminal::MouseEvent& event);
    EventBatch OptimizeBatch(const std::vector<Terminal::MouseEvent>& events);

    // Deliver batched events whose frame deadline passed
    EventBatch Tick();

    // Deliver all batched events now
    EventBatch Flush();

    // When the next batched delivery is due, if any
    std::optional<Core::SteadyTimePoint> NextDeadline() const;

    OptimizerMetrics GetMetrics() const;
    void ResetMetrics();

    void UpdateConfig(const Core::OptimizerConfig& config);
    const Core::OptimizerConfig& GetConfig() const { return m_config; }

    // Drop queued events and disarm the batch deadline
    void Dispose();

    std::size_t PendingCount() const { return m_batcher.PendingCount(); }
    const EventPool& GetPool() const { return *m_pool; }
    const CoordinateCache& GetCoordinateCache() const { return *m_cache; }

private:
    bool IsDuplicate(const Terminal::MouseEvent& event) const;
    bool ShouldThrottle(const Terminal::MouseEvent& event) const;
    EventBatch Deliver(EventBatch batch);
    void RecordTiming(std::chrono::steady_clock::time_point start);
    static std::chrono::microseconds FrameInterval(int targetFps);

    Core::OptimizerConfig m_config;

    std::unique_ptr<EventPool> m_pool;
    std::unique_ptr<CoordinateCache> m_cache;
    FrameBatcher m_batcher;

    std::map<Terminal::MouseEventType, Core::SteadyTimePoint> m_lastAccepted;
    std::optional<Terminal::MouseCoordinates> m_lastMove;

    OptimizerMetrics m_metrics;
    double m_totalProcessingMs = 0.0;
    std::size_t m_timedEvents = 0;
    std::size_t m_cacheHits = 0;
    std::size_t m_cacheLookups = 0;
};

} // namespace TerminalMouse::Input
