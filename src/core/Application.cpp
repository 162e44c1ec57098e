#include "core/Application.h"
#include "core/Config.h"
#include "core/Logging.h"
#include "platform/ITerminalOutput.h"
#include "platform/SystemPlatformProbe.h"
#include "ui/ComponentRegistry.h"
#include "ui/MouseHandler.h"
#include <spdlog/spdlog.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace TerminalMouse::Core {

namespace {
// Held-back partial reports older than this are handed over as keystrokes
constexpr int kPendingInputTimeoutMs = 50;
constexpr int kIdlePollMs = 250;
}

Application::Application() = default;

Application::~Application() {
    Shutdown();
}

bool Application::Initialize() {
    m_config = std::make_unique<Config>();
    m_config->LoadFromEnvironment();
    m_config->Validate();

    InitializeLogging(m_config->GetLogging());
    for (const auto& warning : m_config->GetWarnings()) {
        spdlog::warn("Config: {}", warning);
    }

    if (!isatty(STDIN_FILENO)) {
        spdlog::error("stdin is not a terminal");
        return false;
    }
    if (!EnterRawMode()) {
        return false;
    }

    m_probe = std::make_unique<Platform::SystemPlatformProbe>();
    m_output = std::make_unique<Platform::FdTerminalOutput>(STDOUT_FILENO);
    m_registry = std::make_unique<UI::ComponentRegistry>(m_config->GetRegistry());
    m_mouse = std::make_unique<UI::MouseHandler>(*m_config, *m_probe, *m_output);

    QueryTerminalSize();
    m_mouse->AttachRegistry(m_registry.get());
    m_mouse->SetTerminalSize(m_columns, m_rows);

    UI::MouseEventHandlers handlers;
    handlers.onClick = [this](const Terminal::MouseEvent& e) { Report("click", e); };
    handlers.onDragEnd = [this](const Terminal::MouseEvent& e) { Report("release", e); };
    handlers.onScroll = [this](const Terminal::MouseEvent& e) { Report("scroll", e); };
    handlers.onMove = [this](const Terminal::MouseEvent& e) { Report("move", e); };
    m_mouse->SetEventHandlers(std::move(handlers));

    RegisterDemoRegions();

    if (!m_mouse->Enable()) {
        for (const auto& recommendation : m_mouse->GetRecommendations()) {
            spdlog::warn("{}", recommendation);
        }
        spdlog::warn("Continuing without mouse support");
    }

    DrawRegions();
    m_running = true;
    return true;
}

// ============================================================================
// Terminal setup
// ============================================================================

bool Application::EnterRawMode() {
    termios original{};
    if (tcgetattr(STDIN_FILENO, &original) != 0) {
        spdlog::error("tcgetattr failed: {}", std::strerror(errno));
        return false;
    }

    termios raw = original;
    raw.c_iflag &= static_cast<tcflag_t>(~(BRKINT | ICRNL | INPCK | ISTRIP | IXON));
    raw.c_lflag &= static_cast<tcflag_t>(~(ECHO | ICANON | IEXTEN | ISIG));
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0) {
        spdlog::error("tcsetattr failed: {}", std::strerror(errno));
        return false;
    }
    m_savedTermios = original;
    return true;
}

void Application::RestoreTerminal() {
    if (!m_savedTermios) {
        return;
    }
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &*m_savedTermios) != 0) {
        spdlog::warn("Failed to restore terminal attributes: {}", std::strerror(errno));
    }
    m_savedTermios.reset();
}

void Application::QueryTerminalSize() {
    winsize size{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) == 0 && size.ws_col > 0 && size.ws_row > 0) {
        m_columns = size.ws_col;
        m_rows = size.ws_row;
    }
}

// ============================================================================
// Demo content
// ============================================================================

void Application::RegisterDemoRegions() {
    static const char* kLabels[] = {"Open", "Save", "Quit"};
    int x = 2;
    int priority = 10;
    for (const char* label : kLabels) {
        UI::ClickableRegion region;
        region.id = std::string("button.") + label;
        region.type = UI::RegionType::Button;
        region.bounds = {x, 1, static_cast<int>(std::strlen(label)) + 4, 1};
        region.priority = priority;
        region.accessibility.role = UI::RegionRole::Button;
        region.accessibility.label = label;
        if (std::strcmp(label, "Quit") == 0) {
            region.handlers.onClick = [this](const Terminal::MouseEvent&) { m_running = false; };
        }

        UI::RegistrationResult result = m_registry->Register(std::move(region));
        if (!result.success) {
            for (const auto& error : result.errors) {
                spdlog::error("Region '{}': {}", label, error);
            }
        }
        x += static_cast<int>(std::strlen(label)) + 6;
    }
}

void Application::DrawRegions() {
    std::string screen = "\x1b[2J";
    for (const UI::ClickableRegion* region : m_registry->GetAll()) {
        screen += "\x1b[" + std::to_string(region->bounds.y + 1) + ";" +
                  std::to_string(region->bounds.x + 1) + "H[ " + region->accessibility.label + " ]";
    }
    screen += "\x1b[" + std::to_string(m_statusRow) + ";1HClick a button, scroll, or press q to quit.";
    if (!m_output->Write(screen)) {
        spdlog::warn("Failed to draw demo screen");
    }
}

void Application::Report(const std::string& kind, const Terminal::MouseEvent& event) {
    std::string line = "\x1b[" + std::to_string(m_statusRow + 2) + ";1H\x1b[2K" + kind + " " +
                       Terminal::ToString(event.button) + " at " + std::to_string(event.coordinates.x) +
                       "," + std::to_string(event.coordinates.y);
    if (event.target) {
        line += " on " + event.target->componentId;
    }
    if (event.modifiers.ctrl) line += " +ctrl";
    if (event.modifiers.alt) line += " +alt";
    if (event.modifiers.shift) line += " +shift";
    if (!m_output->Write(line)) {
        spdlog::warn("Failed to write event report");
    }
}

bool Application::HandleKeys(const std::string& keys) {
    // 'q' or Ctrl+C ends the demo
    return keys.find('q') == std::string::npos && keys.find('\x03') == std::string::npos;
}

int Application::PollTimeoutMs() const {
    int timeout = kIdlePollMs;
    if (m_mouse->PendingInputSize() > 0) {
        timeout = kPendingInputTimeoutMs;
    }
    if (auto deadline = m_mouse->NextDeadline()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            *deadline - std::chrono::steady_clock::now()).count();
        timeout = std::min(timeout, static_cast<int>(std::max<long long>(remaining, 0)));
    }
    return timeout;
}

// ============================================================================
// Main loop
// ============================================================================

int Application::Run() {
    spdlog::info("Application::Run() - entering input loop");

    char chunk[4096];
    while (m_running) {
        pollfd fds{STDIN_FILENO, POLLIN, 0};
        int ready = poll(&fds, 1, PollTimeoutMs());
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll failed: {}", std::strerror(errno));
            return 1;
        }

        if (ready == 0) {
            m_mouse->Tick();
            std::string stale = m_mouse->TakePendingInput();
            if (!stale.empty() && !HandleKeys(stale)) {
                m_running = false;
            }
            continue;
        }

        ssize_t count = read(STDIN_FILENO, chunk, sizeof(chunk));
        if (count < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            spdlog::error("read failed: {}", std::strerror(errno));
            return 1;
        }
        if (count == 0) {
            break;
        }

        UI::MouseHandler::InputResult result =
            m_mouse->ProcessInput(std::string_view(chunk, static_cast<std::size_t>(count)));
        if (!HandleKeys(result.remainder)) {
            m_running = false;
        }
    }

    const Input::OptimizerMetrics metrics = m_mouse->GetMetrics();
    spdlog::info("Processed {} of {} mouse events ({} dropped, avg {:.3f} ms)",
                 metrics.processedEvents, metrics.totalEvents, metrics.droppedEvents,
                 metrics.averageProcessingTimeMs);
    return 0;
}

void Application::Shutdown() {
    if (m_mouse) {
        m_mouse->Cleanup();
    }
    if (m_output && m_savedTermios) {
        if (!m_output->Write("\x1b[2J\x1b[H")) {
            spdlog::warn("Failed to clear screen");
        }
    }
    RestoreTerminal();
}

} // namespace TerminalMouse::Core
