#include "input/EventPool.h"
#include <algorithm>

namespace TerminalMouse::Input {

namespace Detail {

struct PoolStorage {
    std::size_t capacity = 0;
    std::vector<std::unique_ptr<Terminal::MouseEvent>> free;
    std::size_t reused = 0;
    std::size_t allocated = 0;
};

} // namespace Detail

void EventReturner::operator()(Terminal::MouseEvent* event) const {
    std::unique_ptr<Terminal::MouseEvent> owned(event);
    auto pool = storage.lock();
    if (!pool || pool->free.size() >= pool->capacity) {
        return;
    }
    *owned = Terminal::MouseEvent{};
    pool->free.push_back(std::move(owned));
}

EventPool::EventPool(std::size_t capacity)
    : m_storage(std::make_shared<Detail::PoolStorage>())
{
    m_storage->capacity = capacity;
    const std::size_t prewarm = std::min<std::size_t>(capacity / 2, 20);
    m_storage->free.reserve(capacity);
    for (std::size_t i = 0; i < prewarm; ++i) {
        m_storage->free.push_back(std::make_unique<Terminal::MouseEvent>());
    }
}

PooledEvent EventPool::Acquire() {
    EventReturner returner{m_storage};
    if (!m_storage->free.empty()) {
        std::unique_ptr<Terminal::MouseEvent> event = std::move(m_storage->free.back());
        m_storage->free.pop_back();
        ++m_storage->reused;
        return PooledEvent(event.release(), returner);
    }
    ++m_storage->allocated;
    return PooledEvent(std::make_unique<Terminal::MouseEvent>().release(), returner);
}

std::size_t EventPool::Capacity() const {
    return m_storage->capacity;
}

std::size_t EventPool::Available() const {
    return m_storage->free.size();
}

std::size_t EventPool::ReusedCount() const {
    return m_storage->reused;
}

std::size_t EventPool::AllocatedCount() const {
    return m_storage->allocated;
}

} // namespace TerminalMouse::Input
