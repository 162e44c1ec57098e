#pragma once

#include "terminal/MouseEvent.h"
#include <cstddef>
#include <memory>
#include <vector>

namespace TerminalMouse::Input {

namespace Detail {
struct PoolStorage;
}

/**
 * @brief Deleter that hands an event back to its pool
 *
 * Holds a weak reference so events outliving the pool are simply freed.
 */
struct EventReturner {
    std::weak_ptr<Detail::PoolStorage> storage;

    void operator()(Terminal::MouseEvent* event) const;
};

// Event on loan from an EventPool; returns itself when destroyed
using PooledEvent = std::unique_ptr<Terminal::MouseEvent, EventReturner>;
using EventBatch = std::vector<PooledEvent>;

/**
 * @brief Fixed-capacity free list of MouseEvent objects
 *
 * Acquire() reuses a free event when one is available and heap-allocates
 * otherwise. A released event is kept only while the free list is below
 * capacity, so the pool never holds more than Capacity() idle events.
 */
class EventPool {
public:
    explicit EventPool(std::size_t capacity);
    ~EventPool() = default;

    EventPool(const EventPool&) = delete;
    EventPool& operator=(const EventPool&) = delete;

    PooledEvent Acquire();

    std::size_t Capacity() const;
    std::size_t Available() const;

    // Acquisitions served from the free list / by a fresh allocation
    std::size_t ReusedCount() const;
    std::size_t AllocatedCount() const;

private:
    std::shared_ptr<Detail::PoolStorage> m_storage;
};

} // namespace TerminalMouse::Input
