#pragma once

#include <optional>
#include <string>

namespace TerminalMouse::Platform {

/**
 * @brief Abstract interface over the OS facts capability detection reads
 *
 * Lets tests describe a terminal environment without touching the real
 * process environment or filesystem.
 */
class IPlatformProbe {
public:
    virtual ~IPlatformProbe() = default;

    // Operating system name as reported by the kernel (e.g. "Linux", "Darwin")
    virtual std::string OperatingSystem() const = 0;

    virtual std::optional<std::string> GetEnv(const std::string& name) const = 0;
    virtual bool FileExists(const std::string& path) const = 0;
    virtual std::optional<std::string> ReadFile(const std::string& path) const = 0;

    // Best-effort long terminal name (terminfo "longname"); nullopt when unavailable
    virtual std::optional<std::string> QueryTerminalName() const = 0;
};

} // namespace TerminalMouse::Platform
