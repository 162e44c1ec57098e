#include "platform/ITerminalOutput.h"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace TerminalMouse::Platform {

bool FdTerminalOutput::Write(std::string_view data) {
    while (!data.empty()) {
        ssize_t written = ::write(m_fd, data.data(), data.size());
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::warn("Terminal write failed: {}", std::strerror(errno));
            return false;
        }
        data.remove_prefix(static_cast<std::size_t>(written));
    }
    return true;
}

} // namespace TerminalMouse::Platform
