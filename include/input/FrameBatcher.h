#pragma once

#include "core/Clock.h"
#include "input/EventPool.h"
#include <chrono>
#include <optional>

namespace TerminalMouse::Input {

/**
 * @brief Coalesces accepted events into at most one delivery per frame
 *
 * Frame-driven like a render loop: Add() delivers immediately when a full
 * frame interval has passed since the last flush, otherwise it arms a
 * deadline at the next frame boundary. The owner calls Tick() (for example
 * when its poll timeout from NextDeadline() expires) to deliver the batch.
 */
class FrameBatcher {
public:
    FrameBatcher(std::chrono::microseconds frameInterval, const Core::IClock& clock);

    /**
     * @brief Queue an event
     * @return The flushed batch if the frame interval has elapsed, else empty
     */
    EventBatch Add(PooledEvent event);

    /**
     * @brief Deliver the queued batch if the armed deadline has passed
     */
    EventBatch Tick();

    /**
     * @brief Deliver everything queued now
     */
    EventBatch Flush();

    /**
     * @brief Drop queued events and disarm the deadline
     */
    void Dispose();

    std::optional<Core::SteadyTimePoint> NextDeadline() const { return m_deadline; }
    std::size_t PendingCount() const { return m_buffer.size(); }
    std::size_t FlushCount() const { return m_flushCount; }

    void SetFrameInterval(std::chrono::microseconds frameInterval) { m_frameInterval = frameInterval; }
    std::chrono::microseconds GetFrameInterval() const { return m_frameInterval; }

private:
    std::chrono::microseconds m_frameInterval;
    const Core::IClock& m_clock;

    EventBatch m_buffer;
    std::optional<Core::SteadyTimePoint> m_lastFlush;
    std::optional<Core::SteadyTimePoint> m_deadline;
    std::size_t m_flushCount = 0;
};

} // namespace TerminalMouse::Input
