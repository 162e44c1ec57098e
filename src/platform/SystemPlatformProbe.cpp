#include "platform/SystemPlatformProbe.h"
#include <spdlog/spdlog.h>
#include <sys/utsname.h>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

namespace TerminalMouse::Platform {

std::string SystemPlatformProbe::OperatingSystem() const {
    struct utsname info {};
    if (uname(&info) != 0) {
        spdlog::warn("uname failed, platform unknown");
        return "unknown";
    }
    return info.sysname;
}

std::optional<std::string> SystemPlatformProbe::GetEnv(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

bool SystemPlatformProbe::FileExists(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

std::optional<std::string> SystemPlatformProbe::ReadFile(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

std::optional<std::string> SystemPlatformProbe::QueryTerminalName() const {
    std::unique_ptr<FILE, int (*)(FILE*)> pipe(popen("tput longname 2>/dev/null", "r"), pclose);
    if (!pipe) {
        spdlog::debug("Could not run tput");
        return std::nullopt;
    }

    std::string output;
    char chunk[256];
    while (std::fgets(chunk, sizeof(chunk), pipe.get())) {
        output += chunk;
    }
    while (!output.empty() && (output.back() == '\n' || output.back() == '\r')) {
        output.pop_back();
    }
    if (output.empty()) {
        return std::nullopt;
    }
    return output;
}

} // namespace TerminalMouse::Platform
