#pragma once

#include "core/Clock.h"
#include "core/Config.h"
#include "ui/RegionTypes.h"
#include "ui/SpatialIndex.h"
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace TerminalMouse::UI {

// Filter for ComponentRegistry::Query; unset fields match everything
struct RegionQuery {
    std::vector<RegionType> types;
    std::optional<bool> enabled;
    std::optional<bool> visible;
    std::optional<int> minPriority;
    std::optional<int> maxPriority;
    std::optional<RegionBounds> intersects;
    std::optional<Terminal::MouseCoordinates> containsPoint;
};

struct RegistryStats {
    std::size_t totalRegions = 0;
    std::size_t enabledRegions = 0;
    std::size_t visibleRegions = 0;
    std::map<RegionType, std::size_t> regionsByType;
    int indexDepth = 0;
    std::size_t indexNodes = 0;
    std::size_t changeEvents = 0;
    double averageLookupTimeMs = 0.0;   // Over the most recent lookups
};

/**
 * @brief Registry of interactive screen regions with spatial hit-testing
 *
 * Hit rule: among enabled, visible regions containing the point, the highest
 * priority wins; equal priorities go to the region registered first. Both
 * FindAt() and FindAtLinear() apply this rule, so they always agree.
 *
 * Every structural change (register, unregister, move, bounds update,
 * terminal resize) rebuilds the spatial index from scratch.
 */
class ComponentRegistry {
public:
    using ChangeListener = std::function<void(const RegionChangeEvent&)>;

    explicit ComponentRegistry(const Core::RegistryConfig& config = {},
                               const Core::IClock& clock = Core::SteadyClock::Instance(),
                               std::unique_ptr<ISpatialIndex> index = nullptr);
    ~ComponentRegistry() = default;

    ComponentRegistry(const ComponentRegistry&) = delete;
    ComponentRegistry& operator=(const ComponentRegistry&) = delete;

    // Mutations
    RegistrationResult Register(ClickableRegion region);
    bool Unregister(const std::string& id);
    RegistrationResult Update(const std::string& id, const RegionUpdate& update);
    RegistrationResult Move(const std::string& id, const RegionBounds& bounds);
    bool SetEnabled(const std::string& id, bool enabled);
    bool SetVisible(const std::string& id, bool visible);
    void Clear();

    // Lookup
    const ClickableRegion* Get(const std::string& id) const;
    bool Has(const std::string& id) const { return m_regions.count(id) > 0; }
    std::size_t Size() const { return m_regions.size(); }
    std::vector<std::string> GetRegionIds() const;     // Registration order
    std::vector<const ClickableRegion*> GetAll() const; // Registration order

    /**
     * @brief Top region at a cell, using the spatial index when enabled
     * @return The region, or nullptr if no enabled, visible region contains the point
     */
    const ClickableRegion* FindAt(int x, int y) const;

    /**
     * @brief Same result as FindAt() by scanning every region
     */
    const ClickableRegion* FindAtLinear(int x, int y) const;

    /**
     * @brief Regions matching all set criteria, highest priority first
     */
    std::vector<const ClickableRegion*> Query(const RegionQuery& query) const;

    // Terminal size; the spatial index root covers it
    void SetTerminalBounds(int width, int height);
    const RegionBounds& GetTerminalBounds() const { return m_terminalBounds; }

    RegistryStats GetStats() const;

    // Change notifications
    const std::deque<RegionChangeEvent>& GetChangeEvents() const { return m_changeEvents; }
    int AddChangeListener(ChangeListener listener);
    void RemoveChangeListener(int listenerId);

private:
    struct Entry {
        ClickableRegion region;
        std::uint64_t sequence = 0;
    };

    static bool Outranks(const Entry& candidate, const Entry& best);
    static bool IsHittable(const Entry& entry, int x, int y);
    std::vector<const Entry*> OrderedEntries() const;

    ValidationResult Validate(const ClickableRegion& region) const;
    std::vector<std::string> OverlapWarnings(const ClickableRegion& region) const;
    void RebuildIndex();
    void Notify(RegionChangeType type, const std::string& id,
                std::optional<RegionBounds> previousBounds = std::nullopt);
    void RecordLookup(double elapsedMs) const;

    Core::RegistryConfig m_config;
    const Core::IClock& m_clock;
    std::unique_ptr<ISpatialIndex> m_index;

    std::unordered_map<std::string, Entry> m_regions;
    std::uint64_t m_nextSequence = 0;
    RegionBounds m_terminalBounds;

    std::deque<RegionChangeEvent> m_changeEvents;
    std::map<int, ChangeListener> m_listeners;
    int m_nextListenerId = 1;

    mutable std::deque<double> m_lookupTimes;
};

} // namespace TerminalMouse::UI
