#pragma once

#include "terminal/MouseEvent.h"
#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>

namespace TerminalMouse::Input {

/**
 * @brief Bounded cache of coordinate pairs keyed by "x,y"
 *
 * Evicts in insertion order once full. Tracks hits and misses for the
 * optimizer metrics.
 */
class CoordinateCache {
public:
    explicit CoordinateCache(std::size_t capacity);

    // Returns the cached pair for these coordinates, inserting it on a miss
    Terminal::MouseCoordinates Canonicalize(const Terminal::MouseCoordinates& coordinates);

    bool Contains(const Terminal::MouseCoordinates& coordinates) const;
    void Clear();

    std::size_t Size() const { return m_entries.size(); }
    std::size_t Capacity() const { return m_capacity; }
    std::size_t Hits() const { return m_hits; }
    std::size_t Misses() const { return m_misses; }

    // hits / (hits + misses), 0 when nothing was looked up
    double HitRate() const;

    static std::string MakeKey(const Terminal::MouseCoordinates& coordinates);

private:
    std::size_t m_capacity;
    std::unordered_map<std::string, Terminal::MouseCoordinates> m_entries;
    std::deque<std::string> m_insertionOrder;
    std::size_t m_hits = 0;
    std::size_t m_misses = 0;
};

} // namespace TerminalMouse::Input
