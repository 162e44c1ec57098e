#include "input/CoordinateCache.h"
#include <algorithm>

namespace TerminalMouse::Input {

CoordinateCache::CoordinateCache(std::size_t capacity)
    : m_capacity(std::max<std::size_t>(capacity, 1))
{
}

std::string CoordinateCache::MakeKey(const Terminal::MouseCoordinates& coordinates) {
    return std::to_string(coordinates.x) + "," + std::to_string(coordinates.y);
}

Terminal::MouseCoordinates CoordinateCache::Canonicalize(const Terminal::MouseCoordinates& coordinates) {
    std::string key = MakeKey(coordinates);
    auto it = m_entries.find(key);
    if (it != m_entries.end()) {
        ++m_hits;
        return it->second;
    }

    ++m_misses;
    if (m_entries.size() >= m_capacity) {
        m_entries.erase(m_insertionOrder.front());
        m_insertionOrder.pop_front();
    }
    m_entries.emplace(key, coordinates);
    m_insertionOrder.push_back(std::move(key));
    return coordinates;
}

bool CoordinateCache::Contains(const Terminal::MouseCoordinates& coordinates) const {
    return m_entries.count(MakeKey(coordinates)) > 0;
}

void CoordinateCache::Clear() {
    m_entries.clear();
    m_insertionOrder.clear();
    m_hits = 0;
    m_misses = 0;
}

double CoordinateCache::HitRate() const {
    const std::size_t lookups = m_hits + m_misses;
    return lookups == 0 ? 0.0 : static_cast<double>(m_hits) / static_cast<double>(lookups);
}

} // namespace TerminalMouse::Input
