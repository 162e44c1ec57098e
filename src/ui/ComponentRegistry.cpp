#include "ui/ComponentRegistry.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <exception>

namespace TerminalMouse::UI {

namespace {
constexpr std::size_t kLookupSamples = 100;
}

ComponentRegistry::ComponentRegistry(const Core::RegistryConfig& config, const Core::IClock& clock,
                                     std::unique_ptr<ISpatialIndex> index)
    : m_config(config)
    , m_clock(clock)
    , m_index(std::move(index))
    , m_terminalBounds{0, 0, std::max(config.terminalWidth, 1), std::max(config.terminalHeight, 1)}
{
    if (!m_index) {
        m_index = std::make_unique<QuadTreeIndex>(config.maxSpatialDepth, config.minRegionsPerNode);
    }
    RebuildIndex();
}

// ============================================================================
// Helpers
// ============================================================================

bool ComponentRegistry::Outranks(const Entry& candidate, const Entry& best) {
    if (candidate.region.priority != best.region.priority) {
        return candidate.region.priority > best.region.priority;
    }
    return candidate.sequence < best.sequence;
}

bool ComponentRegistry::IsHittable(const Entry& entry, int x, int y) {
    return entry.region.isEnabled && entry.region.isVisible && entry.region.bounds.Contains(x, y);
}

std::vector<const ComponentRegistry::Entry*> ComponentRegistry::OrderedEntries() const {
    std::vector<const Entry*> ordered;
    ordered.reserve(m_regions.size());
    for (const auto& [id, entry] : m_regions) {
        ordered.push_back(&entry);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const Entry* a, const Entry* b) { return a->sequence < b->sequence; });
    return ordered;
}

ValidationResult ComponentRegistry::Validate(const ClickableRegion& region) const {
    if (m_config.validateRegions) {
        return ValidateRegion(region);
    }
    ValidationResult result;
    if (region.id.empty()) {
        result.isValid = false;
        result.errors.emplace_back("Component ID is required and cannot be empty");
    }
    return result;
}

std::vector<std::string> ComponentRegistry::OverlapWarnings(const ClickableRegion& region) const {
    std::vector<std::string> warnings;
    for (const Entry* entry : OrderedEntries()) {
        const ClickableRegion& other = entry->region;
        if (other.id != region.id && other.priority == region.priority &&
            other.bounds.Intersects(region.bounds)) {
            warnings.push_back("Component '" + region.id + "' overlaps '" + other.id +
                               "' at equal priority " + std::to_string(region.priority));
        }
    }
    return warnings;
}

void ComponentRegistry::RebuildIndex() {
    if (!m_config.enableSpatialIndex) {
        m_index->Clear();
        return;
    }
    std::vector<IndexEntry> entries;
    entries.reserve(m_regions.size());
    for (const Entry* entry : OrderedEntries()) {
        entries.push_back(IndexEntry{entry->region.id, entry->region.bounds});
    }
    m_index->Rebuild(m_terminalBounds, entries);
}

void ComponentRegistry::Notify(RegionChangeType type, const std::string& id,
                               std::optional<RegionBounds> previousBounds) {
    RegionChangeEvent event{type, id, m_clock.Now(), previousBounds};

    m_changeEvents.push_back(event);
    while (m_changeEvents.size() > static_cast<std::size_t>(std::max(m_config.maxChangeEvents, 0))) {
        m_changeEvents.pop_front();
    }

    // Listeners may add or remove listeners while being notified
    const auto listeners = m_listeners;
    for (const auto& [listenerId, listener] : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            spdlog::warn("Region change listener {} threw on {} '{}': {}",
                         listenerId, ToString(type), id, e.what());
        }
    }
}

void ComponentRegistry::RecordLookup(double elapsedMs) const {
    m_lookupTimes.push_back(elapsedMs);
    if (m_lookupTimes.size() > kLookupSamples) {
        m_lookupTimes.pop_front();
    }
}

// ============================================================================
// Mutations
// ============================================================================

RegistrationResult ComponentRegistry::Register(ClickableRegion region) {
    RegistrationResult result;

    ValidationResult validation = Validate(region);
    if (!validation.isValid) {
        result.error = RegistrationError::Validation;
        result.errors = std::move(validation.errors);
        spdlog::debug("Rejected region '{}': {} validation errors", region.id, result.errors.size());
        return result;
    }
    if (Has(region.id)) {
        result.error = RegistrationError::DuplicateId;
        result.errors.push_back("Component with ID '" + region.id + "' is already registered");
        return result;
    }

    result.warnings = OverlapWarnings(region);
    for (const auto& warning : result.warnings) {
        spdlog::debug("{}", warning);
    }

    const std::string id = region.id;
    m_regions.emplace(id, Entry{std::move(region), m_nextSequence++});
    RebuildIndex();
    result.success = true;
    Notify(RegionChangeType::Added, id);
    return result;
}

bool ComponentRegistry::Unregister(const std::string& id) {
    // id may refer into the region being erased
    const std::string removedId = id;
    if (m_regions.erase(removedId) == 0) {
        return false;
    }
    RebuildIndex();
    Notify(RegionChangeType::Removed, removedId);
    return true;
}

RegistrationResult ComponentRegistry::Update(const std::string& id, const RegionUpdate& update) {
    RegistrationResult result;
    auto it = m_regions.find(id);
    if (it == m_regions.end()) {
        result.error = RegistrationError::NotFound;
        result.errors.push_back("Component with ID '" + id + "' is not registered");
        return result;
    }

    ClickableRegion updated = it->second.region;
    if (update.type) updated.type = *update.type;
    if (update.bounds) updated.bounds = *update.bounds;
    if (update.isEnabled) updated.isEnabled = *update.isEnabled;
    if (update.isVisible) updated.isVisible = *update.isVisible;
    if (update.priority) updated.priority = *update.priority;
    if (update.handlers) updated.handlers = *update.handlers;
    if (update.accessibility) updated.accessibility = *update.accessibility;
    if (update.style) updated.style = *update.style;

    ValidationResult validation = Validate(updated);
    if (!validation.isValid) {
        result.error = RegistrationError::Validation;
        result.errors = std::move(validation.errors);
        return result;
    }

    const RegionBounds previous = it->second.region.bounds;
    const bool boundsChanged = previous != updated.bounds;
    if (boundsChanged || updated.priority != it->second.region.priority) {
        result.warnings = OverlapWarnings(updated);
    }
    it->second.region = std::move(updated);
    if (boundsChanged) {
        RebuildIndex();
    }
    result.success = true;
    Notify(RegionChangeType::Updated, id, boundsChanged ? std::optional<RegionBounds>(previous) : std::nullopt);
    return result;
}

RegistrationResult ComponentRegistry::Move(const std::string& id, const RegionBounds& bounds) {
    RegistrationResult result;
    auto it = m_regions.find(id);
    if (it == m_regions.end()) {
        result.error = RegistrationError::NotFound;
        result.errors.push_back("Component with ID '" + id + "' is not registered");
        return result;
    }

    ClickableRegion moved = it->second.region;
    moved.bounds = bounds;
    ValidationResult validation = Validate(moved);
    if (!validation.isValid) {
        result.error = RegistrationError::Validation;
        result.errors = std::move(validation.errors);
        return result;
    }

    const RegionBounds previous = it->second.region.bounds;
    result.warnings = OverlapWarnings(moved);
    it->second.region.bounds = bounds;
    RebuildIndex();
    result.success = true;
    Notify(RegionChangeType::Moved, id, previous);
    return result;
}

bool ComponentRegistry::SetEnabled(const std::string& id, bool enabled) {
    auto it = m_regions.find(id);
    if (it == m_regions.end()) {
        return false;
    }
    if (it->second.region.isEnabled != enabled) {
        it->second.region.isEnabled = enabled;
        Notify(enabled ? RegionChangeType::Enabled : RegionChangeType::Disabled, id);
    }
    return true;
}

bool ComponentRegistry::SetVisible(const std::string& id, bool visible) {
    auto it = m_regions.find(id);
    if (it == m_regions.end()) {
        return false;
    }
    if (it->second.region.isVisible != visible) {
        it->second.region.isVisible = visible;
        Notify(RegionChangeType::Updated, id);
    }
    return true;
}

void ComponentRegistry::Clear() {
    std::vector<std::string> ids = GetRegionIds();
    m_regions.clear();
    RebuildIndex();
    for (const auto& id : ids) {
        Notify(RegionChangeType::Removed, id);
    }
}

void ComponentRegistry::SetTerminalBounds(int width, int height) {
    m_terminalBounds = RegionBounds{0, 0, std::max(width, 1), std::max(height, 1)};
    RebuildIndex();
}

// ============================================================================
// Lookup
// ============================================================================

const ClickableRegion* ComponentRegistry::Get(const std::string& id) const {
    auto it = m_regions.find(id);
    return it == m_regions.end() ? nullptr : &it->second.region;
}

std::vector<std::string> ComponentRegistry::GetRegionIds() const {
    std::vector<std::string> ids;
    for (const Entry* entry : OrderedEntries()) {
        ids.push_back(entry->region.id);
    }
    return ids;
}

std::vector<const ClickableRegion*> ComponentRegistry::GetAll() const {
    std::vector<const ClickableRegion*> regions;
    for (const Entry* entry : OrderedEntries()) {
        regions.push_back(&entry->region);
    }
    return regions;
}

const ClickableRegion* ComponentRegistry::FindAt(int x, int y) const {
    if (!m_config.enableSpatialIndex) {
        return FindAtLinear(x, y);
    }

    const auto start = std::chrono::steady_clock::now();
    const Entry* best = nullptr;
    for (const std::string& id : m_index->Candidates(x, y)) {
        auto it = m_regions.find(id);
        if (it == m_regions.end() || !IsHittable(it->second, x, y)) {
            continue;
        }
        if (!best || Outranks(it->second, *best)) {
            best = &it->second;
        }
    }
    RecordLookup(Core::ElapsedMs(start, std::chrono::steady_clock::now()));
    return best ? &best->region : nullptr;
}

const ClickableRegion* ComponentRegistry::FindAtLinear(int x, int y) const {
    const auto start = std::chrono::steady_clock::now();
    const Entry* best = nullptr;
    for (const auto& [id, entry] : m_regions) {
        if (IsHittable(entry, x, y) && (!best || Outranks(entry, *best))) {
            best = &entry;
        }
    }
    RecordLookup(Core::ElapsedMs(start, std::chrono::steady_clock::now()));
    return best ? &best->region : nullptr;
}

std::vector<const ClickableRegion*> ComponentRegistry::Query(const RegionQuery& query) const {
    std::vector<const Entry*> matches;
    for (const Entry* entry : OrderedEntries()) {
        const ClickableRegion& region = entry->region;
        if (!query.types.empty() &&
            std::find(query.types.begin(), query.types.end(), region.type) == query.types.end()) {
            continue;
        }
        if (query.enabled && region.isEnabled != *query.enabled) continue;
        if (query.visible && region.isVisible != *query.visible) continue;
        if (query.minPriority && region.priority < *query.minPriority) continue;
        if (query.maxPriority && region.priority > *query.maxPriority) continue;
        if (query.intersects && !region.bounds.Intersects(*query.intersects)) continue;
        if (query.containsPoint &&
            !region.bounds.Contains(query.containsPoint->x, query.containsPoint->y)) continue;
        matches.push_back(entry);
    }

    // Already in registration order, so a stable sort keeps ties in that order
    std::stable_sort(matches.begin(), matches.end(), [](const Entry* a, const Entry* b) {
        return a->region.priority > b->region.priority;
    });

    std::vector<const ClickableRegion*> result;
    result.reserve(matches.size());
    for (const Entry* entry : matches) {
        result.push_back(&entry->region);
    }
    return result;
}

RegistryStats ComponentRegistry::GetStats() const {
    RegistryStats stats;
    stats.totalRegions = m_regions.size();
    for (const auto& [id, entry] : m_regions) {
        if (entry.region.isEnabled) ++stats.enabledRegions;
        if (entry.region.isVisible) ++stats.visibleRegions;
        ++stats.regionsByType[entry.region.type];
    }
    stats.indexDepth = m_index->Depth();
    stats.indexNodes = m_index->NodeCount();
    stats.changeEvents = m_changeEvents.size();
    if (!m_lookupTimes.empty()) {
        double total = 0.0;
        for (double sample : m_lookupTimes) {
            total += sample;
        }
        stats.averageLookupTimeMs = total / static_cast<double>(m_lookupTimes.size());
    }
    return stats;
}

// ============================================================================
// Change listeners
// ============================================================================

int ComponentRegistry::AddChangeListener(ChangeListener listener) {
    const int id = m_nextListenerId++;
    m_listeners.emplace(id, std::move(listener));
    return id;
}

void ComponentRegistry::RemoveChangeListener(int listenerId) {
    m_listeners.erase(listenerId);
}

} // namespace TerminalMouse::UI
