#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace TerminalMouse::Core {

// Protocol parser configuration
struct ParserConfig {
    int maxCoordinate = 9999;          // Decoded coordinates are clamped to this (0-based)
};

// Event optimizer configuration
struct OptimizerConfig {
    int targetFps = 60;
    bool enableFrameBatching = true;
    bool enableDeduplication = true;
    bool enableThrottling = true;
    bool enableCoordinateCache = true;
    bool enablePerformanceMonitoring = true;
    int coordinateCacheSize = 1000;
    int eventPoolSize = 100;
    int dedupeIntervalMs = 16;         // Non-move events of one type closer than this are dropped
    int moveThrottleMs = 8;
    int dragThrottleMs = 12;
};

// Component registry configuration
struct RegistryConfig {
    bool enableSpatialIndex = true;
    bool validateRegions = true;
    int maxSpatialDepth = 4;
    int minRegionsPerNode = 4;
    int maxChangeEvents = 100;
    int terminalWidth = 80;
    int terminalHeight = 24;
};

// Integration bridge configuration
struct IntegrationConfig {
    bool enabled = true;
    bool autoDetect = true;            // Run platform detection on Enable()
    bool validateBounds = true;        // Drop events outside the terminal size
    bool debug = false;
    int dragThreshold = 3;             // Cells moved while pressed before a drag is recognised
    std::size_t maxPendingBytes = 32;  // Cap on carried-over partial sequences
};

// Logging configuration
struct LoggingConfig {
    bool debug = false;
    std::string level = "info";        // trace, debug, info, warn, error, off
};

// Main configuration class
class Config {
public:
    // Returns the value of an environment variable, or nullopt if unset
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    Config() = default;
    ~Config() = default;

    // Apply TERMMOUSE_* overrides; uses the process environment when lookup is empty.
    // Invalid values are skipped and recorded as warnings.
    void LoadFromEnvironment(const EnvLookup& lookup = nullptr);

    // Clamp out-of-range values set programmatically, recording a warning for each
    void Validate();

    // Accessors
    const ParserConfig& GetParser() const { return m_parser; }
    const OptimizerConfig& GetOptimizer() const { return m_optimizer; }
    const RegistryConfig& GetRegistry() const { return m_registry; }
    const IntegrationConfig& GetIntegration() const { return m_integration; }
    const LoggingConfig& GetLogging() const { return m_logging; }

    // Mutable accessors
    ParserConfig& GetParserMut() { return m_parser; }
    OptimizerConfig& GetOptimizerMut() { return m_optimizer; }
    RegistryConfig& GetRegistryMut() { return m_registry; }
    IntegrationConfig& GetIntegrationMut() { return m_integration; }
    LoggingConfig& GetLoggingMut() { return m_logging; }

    const std::vector<std::string>& GetWarnings() const { return m_warnings; }
    void ClearWarnings() { m_warnings.clear(); }

    static std::optional<bool> ParseBool(const std::string& value);

private:
    void ApplyBool(const EnvLookup& lookup, const std::string& name, bool& target);
    void ApplyInt(const EnvLookup& lookup, const std::string& name, int& target, int minValue, int maxValue);
    void ClampInt(const char* name, int& value, int minValue, int maxValue);

    ParserConfig m_parser;
    OptimizerConfig m_optimizer;
    RegistryConfig m_registry;
    IntegrationConfig m_integration;
    LoggingConfig m_logging;

    std::vector<std::string> m_warnings;
};

} // namespace TerminalMouse::Core
