/**
 * @file Application.h
 * @brief Interactive demo for the TerminalMouse library
 *
 * Puts the controlling terminal into raw mode, enables mouse reporting,
 * registers a row of clickable regions and reports decoded events until the
 * user presses 'q'.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <termios.h>

namespace TerminalMouse {

namespace Core { class Config; }
namespace Platform {
    class SystemPlatformProbe;
    class FdTerminalOutput;
}
namespace Terminal { struct MouseEvent; }
namespace UI {
    class ComponentRegistry;
    class MouseHandler;
}

namespace Core {

/**
 * @class Application
 * @brief Owns the demo's components and runs its input loop
 *
 * @example
 * @code
 * Core::Application app;
 * if (!app.Initialize()) {
 *     return EXIT_FAILURE;
 * }
 * return app.Run();
 * @endcode
 */
class Application {
public:
    Application();
    ~Application();

    /**
     * @brief Load configuration, set up logging and enable mouse reporting
     * @return true if the terminal could be prepared
     */
    [[nodiscard]] bool Initialize();

    /**
     * @brief Run the input loop until 'q' or end of input
     * @return Exit code (0 for success)
     */
    int Run();

    /**
     * @brief Disable mouse reporting and restore the terminal; idempotent
     */
    void Shutdown();

private:
    bool EnterRawMode();
    void RestoreTerminal();
    void QueryTerminalSize();
    void RegisterDemoRegions();
    void DrawRegions();
    void Report(const std::string& kind, const Terminal::MouseEvent& event);
    bool HandleKeys(const std::string& keys);
    int PollTimeoutMs() const;

    std::unique_ptr<Config> m_config;
    std::unique_ptr<Platform::SystemPlatformProbe> m_probe;
    std::unique_ptr<Platform::FdTerminalOutput> m_output;
    std::unique_ptr<UI::ComponentRegistry> m_registry;
    std::unique_ptr<UI::MouseHandler> m_mouse;

    std::optional<termios> m_savedTermios;
    int m_columns = 80;
    int m_rows = 24;
    int m_statusRow = 4;
    bool m_running = false;
};

} // namespace Core
} // namespace TerminalMouse
