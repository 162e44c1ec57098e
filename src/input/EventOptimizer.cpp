#include "input/EventOptimizer.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>

namespace TerminalMouse::Input {

using Terminal::MouseEvent;
using Terminal::MouseEventType;

EventOptimizer::EventOptimizer(const Core::OptimizerConfig& config, const Core::IClock& clock)
    : m_config(config)
    , m_pool(std::make_unique<EventPool>(static_cast<std::size_t>(std::max(config.eventPoolSize, 1))))
    , m_cache(std::make_unique<CoordinateCache>(static_cast<std::size_t>(std::max(config.coordinateCacheSize, 1))))
    , m_batcher(FrameInterval(config.targetFps), clock)
{
}

EventOptimizer::~EventOptimizer() {
    Dispose();
}

std::chrono::microseconds EventOptimizer::FrameInterval(int targetFps) {
    return std::chrono::microseconds(1000000 / std::max(targetFps, 1));
}

// ============================================================================
// Pipeline stages
// ============================================================================

bool EventOptimizer::IsDuplicate(const MouseEvent& event) const {
    if (event.type == MouseEventType::Move) {
        return m_lastMove && *m_lastMove == event.coordinates;
    }
    auto it = m_lastAccepted.find(event.type);
    if (it == m_lastAccepted.end()) {
        return false;
    }
    return event.timestamp - it->second < Core::Milliseconds(m_config.dedupeIntervalMs);
}

bool EventOptimizer::ShouldThrottle(const MouseEvent& event) const {
    int spacingMs = 0;
    switch (event.type) {
        case MouseEventType::Move: spacingMs = m_config.moveThrottleMs; break;
        case MouseEventType::Drag: spacingMs = m_config.dragThrottleMs; break;
        default: return false;
    }
    auto it = m_lastAccepted.find(event.type);
    if (it == m_lastAccepted.end()) {
        return false;
    }
    return event.timestamp - it->second < Core::Milliseconds(spacingMs);
}

void EventOptimizer::RecordTiming(std::chrono::steady_clock::time_point start) {
    if (!m_config.enablePerformanceMonitoring) {
        return;
    }
    const double elapsedMs = Core::ElapsedMs(start, std::chrono::steady_clock::now());
    m_totalProcessingMs += elapsedMs;
    ++m_timedEvents;
    m_metrics.peakProcessingTimeMs = std::max(m_metrics.peakProcessingTimeMs, elapsedMs);
}

EventBatch EventOptimizer::Deliver(EventBatch batch) {
    if (!batch.empty()) {
        ++m_metrics.batchesFlushed;
    }
    return batch;
}

EventBatch EventOptimizer::Optimize(const MouseEvent& event) {
    const auto start = std::chrono::steady_clock::now();
    ++m_metrics.totalEvents;

    auto last = m_lastAccepted.find(event.type);
    const bool stale = last != m_lastAccepted.end() && event.timestamp < last->second;
    if (stale || (m_config.enableDeduplication && IsDuplicate(event))) {
        ++m_metrics.droppedEvents;
        ++m_metrics.deduplicatedEvents;
        RecordTiming(start);
        return {};
    }
    if (m_config.enableThrottling && ShouldThrottle(event)) {
        ++m_metrics.droppedEvents;
        ++m_metrics.throttledEvents;
        RecordTiming(start);
        return {};
    }

    m_lastAccepted[event.type] = event.timestamp;
    if (event.type == MouseEventType::Move) {
        m_lastMove = event.coordinates;
    }

    Terminal::MouseCoordinates coordinates = event.coordinates;
    if (m_config.enableCoordinateCache) {
        const std::size_t hitsBefore = m_cache->Hits();
        coordinates = m_cache->Canonicalize(event.coordinates);
        ++m_cacheLookups;
        if (m_cache->Hits() > hitsBefore) {
            ++m_cacheHits;
        }
    }

    if (m_pool->Available() > 0) {
        ++m_metrics.pooledEvents;
    } else {
        ++m_metrics.heapEvents;
    }
    PooledEvent pooled = m_pool->Acquire();
    *pooled = event;
    pooled->coordinates = coordinates;
    ++m_metrics.processedEvents;

    EventBatch result;
    if (m_config.enableFrameBatching) {
        result = Deliver(m_batcher.Add(std::move(pooled)));
    } else {
        result.push_back(std::move(pooled));
    }
    RecordTiming(start);
    return result;
}

EventBatch EventOptimizer::OptimizeBatch(const std::vector<MouseEvent>& events) {
    EventBatch result;
    for (const MouseEvent& event : events) {
        EventBatch part = Optimize(event);
        std::move(part.begin(), part.end(), std::back_inserter(result));
    }
    return result;
}

EventBatch EventOptimizer::Tick() {
    return Deliver(m_batcher.Tick());
}

EventBatch EventOptimizer::Flush() {
    return Deliver(m_batcher.Flush());
}

std::optional<Core::SteadyTimePoint> EventOptimizer::NextDeadline() const {
    return m_batcher.NextDeadline();
}

// ============================================================================
// Metrics and configuration
// ============================================================================

OptimizerMetrics EventOptimizer::GetMetrics() const {
    OptimizerMetrics metrics = m_metrics;
    metrics.averageProcessingTimeMs =
        m_timedEvents == 0 ? 0.0 : m_totalProcessingMs / static_cast<double>(m_timedEvents);
    metrics.cacheHitRate =
        m_cacheLookups == 0 ? 0.0 : static_cast<double>(m_cacheHits) / static_cast<double>(m_cacheLookups);
    metrics.throttlingRate = metrics.totalEvents == 0
        ? 0.0
        : static_cast<double>(metrics.droppedEvents) / static_cast<double>(metrics.totalEvents);
    return metrics;
}

void EventOptimizer::ResetMetrics() {
    m_metrics = OptimizerMetrics{};
    m_totalProcessingMs = 0.0;
    m_timedEvents = 0;
    m_cacheHits = 0;
    m_cacheLookups = 0;
}

void EventOptimizer::UpdateConfig(const Core::OptimizerConfig& config) {
    const bool poolChanged = config.eventPoolSize != m_config.eventPoolSize;
    const bool cacheChanged = config.coordinateCacheSize != m_config.coordinateCacheSize;
    const bool batchingDisabled = m_config.enableFrameBatching && !config.enableFrameBatching;
    m_config = config;

    if (poolChanged) {
        // Events still on loan from the old pool are freed when released
        m_pool = std::make_unique<EventPool>(static_cast<std::size_t>(std::max(config.eventPoolSize, 1)));
    }
    if (cacheChanged) {
        m_cache = std::make_unique<CoordinateCache>(static_cast<std::size_t>(std::max(config.coordinateCacheSize, 1)));
    }
    m_batcher.SetFrameInterval(FrameInterval(config.targetFps));
    if (batchingDisabled && m_batcher.PendingCount() > 0) {
        spdlog::debug("Frame batching disabled with {} events queued; call Flush() to deliver them",
                      m_batcher.PendingCount());
    }
}

void EventOptimizer::Dispose() {
    m_batcher.Dispose();
}

} // namespace TerminalMouse::Input
