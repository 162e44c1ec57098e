#include "input/FrameBatcher.h"

namespace TerminalMouse::Input {

FrameBatcher::FrameBatcher(std::chrono::microseconds frameInterval, const Core::IClock& clock)
    : m_frameInterval(frameInterval)
    , m_clock(clock)
{
}

EventBatch FrameBatcher::Add(PooledEvent event) {
    m_buffer.push_back(std::move(event));

    const Core::SteadyTimePoint now = m_clock.Now();
    if (!m_lastFlush || now - *m_lastFlush >= m_frameInterval) {
        return Flush();
    }
    if (!m_deadline) {
        m_deadline = *m_lastFlush + m_frameInterval;
    }
    return {};
}

EventBatch FrameBatcher::Tick() {
    if (!m_deadline || m_clock.Now() < *m_deadline) {
        return {};
    }
    return Flush();
}

EventBatch FrameBatcher::Flush() {
    m_deadline.reset();
    if (m_buffer.empty()) {
        return {};
    }
    m_lastFlush = m_clock.Now();
    ++m_flushCount;
    EventBatch batch;
    batch.swap(m_buffer);
    return batch;
}

void FrameBatcher::Dispose() {
    m_deadline.reset();
    m_buffer.clear();
}

} // namespace TerminalMouse::Input
