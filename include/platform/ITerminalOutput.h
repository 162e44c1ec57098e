#pragma once

#include <string_view>

namespace TerminalMouse::Platform {

/**
 * @brief Sink for terminal control sequences
 */
class ITerminalOutput {
public:
    virtual ~ITerminalOutput() = default;

    // Write all bytes; returns false if the sink failed
    virtual bool Write(std::string_view data) = 0;
};

/**
 * @brief ITerminalOutput writing to a file descriptor (stdout by default)
 */
class FdTerminalOutput : public ITerminalOutput {
public:
    explicit FdTerminalOutput(int fd = 1) : m_fd(fd) {}

    bool Write(std::string_view data) override;

private:
    int m_fd;
};

} // namespace TerminalMouse::Platform
