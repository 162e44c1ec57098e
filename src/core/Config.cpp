#include "core/Config.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace TerminalMouse::Core {

namespace {

std::optional<std::string> ProcessEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool IsKnownLogLevel(const std::string& level) {
    static const char* kLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    return std::any_of(std::begin(kLevels), std::end(kLevels),
                       [&](const char* known) { return level == known; });
}

} // namespace

std::optional<bool> Config::ParseBool(const std::string& value) {
    std::string lower = ToLower(value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        return false;
    }
    return std::nullopt;
}

void Config::ApplyBool(const EnvLookup& lookup, const std::string& name, bool& target) {
    auto raw = lookup(name);
    if (!raw) {
        return;
    }
    auto parsed = ParseBool(*raw);
    if (!parsed) {
        m_warnings.push_back(name + ": expected a boolean, got '" + *raw + "'");
        return;
    }
    target = *parsed;
}

void Config::ApplyInt(const EnvLookup& lookup, const std::string& name, int& target,
                      int minValue, int maxValue) {
    auto raw = lookup(name);
    if (!raw) {
        return;
    }
    int parsed = 0;
    const char* begin = raw->data();
    const char* end = begin + raw->size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end) {
        m_warnings.push_back(name + ": expected an integer, got '" + *raw + "'");
        return;
    }
    if (parsed < minValue || parsed > maxValue) {
        m_warnings.push_back(name + ": " + std::to_string(parsed) + " is outside " +
                             std::to_string(minValue) + "-" + std::to_string(maxValue));
        return;
    }
    target = parsed;
}

void Config::LoadFromEnvironment(const EnvLookup& lookup) {
    EnvLookup resolved = lookup ? lookup : EnvLookup(ProcessEnv);

    ApplyBool(resolved, "TERMMOUSE_ENABLED", m_integration.enabled);
    ApplyBool(resolved, "TERMMOUSE_AUTO_DETECT", m_integration.autoDetect);
    ApplyBool(resolved, "TERMMOUSE_VALIDATE_BOUNDS", m_integration.validateBounds);

    bool debug = m_logging.debug;
    ApplyBool(resolved, "TERMMOUSE_DEBUG", debug);
    m_logging.debug = debug;
    m_integration.debug = debug;

    if (auto level = resolved("TERMMOUSE_LOG_LEVEL")) {
        std::string lower = ToLower(*level);
        if (IsKnownLogLevel(lower)) {
            m_logging.level = lower;
        } else {
            m_warnings.push_back("TERMMOUSE_LOG_LEVEL: unknown level '" + *level + "'");
        }
    }

    ApplyInt(resolved, "TERMMOUSE_TARGET_FPS", m_optimizer.targetFps, 1, 240);
    ApplyBool(resolved, "TERMMOUSE_FRAME_BATCHING", m_optimizer.enableFrameBatching);
    ApplyBool(resolved, "TERMMOUSE_DEDUPLICATION", m_optimizer.enableDeduplication);
    ApplyBool(resolved, "TERMMOUSE_THROTTLING", m_optimizer.enableThrottling);
    ApplyBool(resolved, "TERMMOUSE_COORDINATE_CACHE", m_optimizer.enableCoordinateCache);
    ApplyInt(resolved, "TERMMOUSE_COORDINATE_CACHE_SIZE", m_optimizer.coordinateCacheSize, 1, 100000);
    ApplyInt(resolved, "TERMMOUSE_EVENT_POOL_SIZE", m_optimizer.eventPoolSize, 1, 10000);

    ApplyBool(resolved, "TERMMOUSE_SPATIAL_INDEX", m_registry.enableSpatialIndex);
    ApplyInt(resolved, "TERMMOUSE_SPATIAL_DEPTH", m_registry.maxSpatialDepth, 1, 16);
}

void Config::ClampInt(const char* name, int& value, int minValue, int maxValue) {
    int clamped = std::clamp(value, minValue, maxValue);
    if (clamped != value) {
        m_warnings.push_back(std::string(name) + ": " + std::to_string(value) +
                             " clamped to " + std::to_string(clamped));
        value = clamped;
    }
}

void Config::Validate() {
    ClampInt("parser.maxCoordinate", m_parser.maxCoordinate, 1, 65535);
    ClampInt("optimizer.targetFps", m_optimizer.targetFps, 1, 240);
    ClampInt("optimizer.coordinateCacheSize", m_optimizer.coordinateCacheSize, 1, 100000);
    ClampInt("optimizer.eventPoolSize", m_optimizer.eventPoolSize, 1, 10000);
    ClampInt("optimizer.dedupeIntervalMs", m_optimizer.dedupeIntervalMs, 0, 1000);
    ClampInt("optimizer.moveThrottleMs", m_optimizer.moveThrottleMs, 0, 1000);
    ClampInt("optimizer.dragThrottleMs", m_optimizer.dragThrottleMs, 0, 1000);
    ClampInt("registry.maxSpatialDepth", m_registry.maxSpatialDepth, 1, 16);
    ClampInt("registry.minRegionsPerNode", m_registry.minRegionsPerNode, 1, 1000);
    ClampInt("registry.maxChangeEvents", m_registry.maxChangeEvents, 0, 100000);
    ClampInt("registry.terminalWidth", m_registry.terminalWidth, 1, 65535);
    ClampInt("registry.terminalHeight", m_registry.terminalHeight, 1, 65535);
    ClampInt("integration.dragThreshold", m_integration.dragThreshold, 0, 50);
}

} // namespace TerminalMouse::Core
