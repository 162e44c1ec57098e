#pragma once

#include "platform/IPlatformProbe.h"

namespace TerminalMouse::Platform {

/**
 * @brief IPlatformProbe backed by the live process environment
 *
 * Uses uname(2), getenv, the filesystem and `tput longname`.
 */
class SystemPlatformProbe : public IPlatformProbe {
public:
    std::string OperatingSystem() const override;
    std::optional<std::string> GetEnv(const std::string& name) const override;
    bool FileExists(const std::string& path) const override;
    std::optional<std::string> ReadFile(const std::string& path) const override;
    std::optional<std::string> QueryTerminalName() const override;
};

} // namespace TerminalMouse::Platform
