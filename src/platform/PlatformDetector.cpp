#include "platform/PlatformDetector.h"
#include "terminal/MouseSequences.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <exception>
#include <initializer_list>

namespace TerminalMouse::Platform {

namespace Seq = Terminal::Sequences;

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

bool ContainsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [&](const char* needle) { return Contains(haystack, needle); });
}

// Terminals with complete SGR, motion and focus reporting
bool IsRichTerminal(const std::string& term, const std::string& program) {
    return ContainsAny(program, {"vscode", "iterm2", "windows terminal", "wezterm", "ghostty"}) ||
           ContainsAny(term, {"xterm-256color", "xterm-kitty", "alacritty"});
}

} // namespace

bool ProtocolSupport::Supports(MouseProtocol protocol) const {
    return std::find(supportedProtocols.begin(), supportedProtocols.end(), protocol) !=
           supportedProtocols.end();
}

// ============================================================================
// Decision table
// ============================================================================

std::vector<MouseProtocol> DetectSupportedProtocols(const TerminalInfo& terminal) {
    const std::string term = ToLower(terminal.term);
    const std::string program = ToLower(terminal.termProgram);
    std::vector<MouseProtocol> protocols;

    if (ContainsAny(term, {"xterm", "screen", "tmux", "alacritty", "kitty"}) ||
        ContainsAny(program, {"vscode", "iterm", "terminal", "wezterm", "ghostty"})) {
        protocols.push_back(MouseProtocol::Sgr);
    }
    if (ContainsAny(term, {"xterm", "screen", "tmux"})) {
        protocols.push_back(MouseProtocol::Utf8);
    }
    if (Contains(term, "rxvt") || protocols.empty()) {
        protocols.push_back(MouseProtocol::Urxvt);
    }
    return protocols;
}

Terminal::MouseCoordinates MaxCoordinatesFor(const TerminalInfo& terminal) {
    const std::string term = ToLower(terminal.term);
    if (ContainsAny(term, {"utf8", "unicode"})) {
        return {Seq::kLegacyMaxCoordinate, Seq::kLegacyMaxCoordinate};
    }
    return {9999, 9999};
}

SupportLevel DetermineSupportLevel(bool isWSL, bool isContainer, const TerminalInfo& terminal) {
    const std::string term = ToLower(terminal.term);
    const std::string program = ToLower(terminal.termProgram);

    if (term.empty() && program.empty()) {
        return SupportLevel::None;
    }
    if (IsRichTerminal(term, program)) {
        return isContainer ? SupportLevel::Partial : SupportLevel::Full;
    }
    if (isWSL) {
        const bool windowsTerminal = Contains(program, "windows terminal") || terminal.windowsTerminalSession;
        return windowsTerminal ? SupportLevel::Partial : SupportLevel::Minimal;
    }
    if (isContainer) {
        return SupportLevel::Partial;
    }
    if (ContainsAny(term, {"xterm", "screen"})) {
        return SupportLevel::Partial;
    }
    if (ContainsAny(term, {"dumb", "unknown"})) {
        return SupportLevel::None;
    }
    return SupportLevel::Minimal;
}

ProtocolConfiguration ChooseProtocol(const ProtocolSupport& support) {
    ProtocolConfiguration config;
    if (support.Supports(MouseProtocol::Sgr)) {
        config.mode = MouseProtocol::Sgr;
        config.enableButtons = true;
        config.enableMotion = support.supportLevel == SupportLevel::Full;
        config.enableFocus = support.supportLevel == SupportLevel::Full;
    } else if (support.Supports(MouseProtocol::Utf8)) {
        config.mode = MouseProtocol::Utf8;
        config.enableButtons = true;
    } else {
        config.mode = MouseProtocol::Urxvt;
        config.enableButtons = support.supportLevel != SupportLevel::Minimal;
    }
    return config;
}

// ============================================================================
// PlatformDetector
// ============================================================================

PlatformDetector::PlatformDetector(const IPlatformProbe& probe, ITerminalOutput& output)
    : m_probe(probe)
    , m_output(output)
{
}

PlatformDetector::~PlatformDetector() {
    // The detection task captures this; let it finish before members go away
    std::shared_future<ProtocolSupport> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        pending = m_detection;
    }
    if (pending.valid()) {
        pending.wait();
    }
}

std::string PlatformDetector::Env(const char* name) const {
    return m_probe.GetEnv(name).value_or("");
}

OsFamily PlatformDetector::DetectOsFamily() const {
    const std::string os = ToLower(m_probe.OperatingSystem());
    if (Contains(os, "linux")) {
        return OsFamily::Linux;
    }
    if (Contains(os, "darwin")) {
        return OsFamily::Darwin;
    }
    if (ContainsAny(os, {"windows", "mingw", "msys", "cygwin"})) {
        return OsFamily::Windows;
    }
    return OsFamily::Unknown;
}

bool PlatformDetector::DetectWSL(OsFamily os) const {
    if (m_probe.GetEnv("WSL_DISTRO_NAME") || m_probe.GetEnv("WSLENV")) {
        return true;
    }
    if (os != OsFamily::Linux) {
        return false;
    }
    auto version = m_probe.ReadFile("/proc/version");
    if (!version) {
        return false;
    }
    const std::string lower = ToLower(*version);
    return ContainsAny(lower, {"microsoft", "wsl"});
}

bool PlatformDetector::DetectContainer() const {
    if (m_probe.FileExists("/.dockerenv") || m_probe.FileExists("/run/.containerenv")) {
        return true;
    }
    return m_probe.GetEnv("KUBERNETES_SERVICE_HOST") || m_probe.GetEnv("container") ||
           m_probe.GetEnv("DOCKER_CONTAINER");
}

TerminalInfo PlatformDetector::DetectTerminal() const {
    TerminalInfo info;
    info.term = Env("TERM");
    info.termProgram = Env("TERM_PROGRAM");
    info.colorTerm = Env("COLORTERM");
    info.termInfo = Env("TERMINFO");
    // Windows Terminal identifies itself through WT_SESSION rather than TERM_PROGRAM
    info.windowsTerminalSession = m_probe.GetEnv("WT_SESSION").has_value();
    info.longName = m_probe.QueryTerminalName().value_or("");
    return info;
}

ProtocolSupport PlatformDetector::RunDetection() const {
    ProtocolSupport support;
    try {
        support.platform = DetectOsFamily();
        support.isWSL = DetectWSL(support.platform);
        support.isContainer = DetectContainer();
        support.terminal = DetectTerminal();
        support.supportedProtocols = DetectSupportedProtocols(support.terminal);
        support.maxCoordinates = MaxCoordinatesFor(support.terminal);
        support.supportLevel = DetermineSupportLevel(support.isWSL, support.isContainer, support.terminal);
    } catch (const std::exception& e) {
        spdlog::warn("Platform detection failed, mouse support disabled: {}", e.what());
        support = ProtocolSupport{};
        support.supportedProtocols = {MouseProtocol::Urxvt};
        support.supportLevel = SupportLevel::None;
        return support;
    }

    spdlog::debug("Mouse capabilities: platform={} wsl={} container={} term='{}' program='{}' level={}",
                  ToString(support.platform), support.isWSL, support.isContainer,
                  support.terminal.term, support.terminal.termProgram, ToString(support.supportLevel));
    return support;
}

std::shared_future<ProtocolSupport> PlatformDetector::DetectCapabilitiesAsync() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_detection.valid()) {
        m_detection = std::async(std::launch::async, [this] { return RunDetection(); }).share();
    }
    return m_detection;
}

ProtocolSupport PlatformDetector::DetectCapabilities() {
    return DetectCapabilitiesAsync().get();
}

std::optional<ProtocolSupport> PlatformDetector::GetCachedCapabilities() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_detection.valid() ||
        m_detection.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return std::nullopt;
    }
    return m_detection.get();
}

ProtocolConfiguration PlatformDetector::OptimalProtocol() {
    return ChooseProtocol(DetectCapabilities());
}

bool PlatformDetector::Configure() {
    const ProtocolSupport support = DetectCapabilities();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_configured) {
        return true;
    }
    if (support.supportLevel == SupportLevel::None) {
        spdlog::info("Terminal reports no mouse support, leaving reporting off");
        return false;
    }

    const ProtocolConfiguration protocol = ChooseProtocol(support);
    std::string sequence;
    if (protocol.enableTracking) {
        sequence += Seq::kEnableTracking;
    }
    if (protocol.enableButtons) {
        sequence += Seq::kEnableButtonEvents;
    }
    if (protocol.enableMotion) {
        sequence += Seq::kEnableAnyMotion;
    }
    switch (protocol.mode) {
        case MouseProtocol::Sgr:   sequence += Seq::kEnableSgrMode; break;
        case MouseProtocol::Utf8:  sequence += Seq::kEnableUtf8Mode; break;
        case MouseProtocol::Urxvt: sequence += Seq::kEnableUrxvtMode; break;
    }
    if (protocol.enableFocus) {
        sequence += Seq::kEnableFocusEvents;
    }

    if (!WriteSequence(sequence)) {
        spdlog::warn("Failed to enable mouse reporting");
        return false;
    }
    m_configured = true;
    spdlog::info("Mouse reporting enabled ({} mode, level {})", ToString(protocol.mode),
                 ToString(support.supportLevel));
    return true;
}

bool PlatformDetector::Disable() {
    const ProtocolSupport support = DetectCapabilities();
    if (support.supportLevel == SupportLevel::None) {
        // Nothing was ever enabled on a terminal without mouse support
        std::lock_guard<std::mutex> lock(m_mutex);
        m_configured = false;
        return true;
    }

    std::string sequence;
    sequence += Seq::kDisableAnyMotion;
    sequence += Seq::kDisableButtonEvents;
    sequence += Seq::kDisableTracking;
    sequence += Seq::kDisableSgrMode;
    sequence += Seq::kDisableUtf8Mode;
    sequence += Seq::kDisableUrxvtMode;
    sequence += Seq::kDisableFocusEvents;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_configured = false;
    if (!WriteSequence(sequence)) {
        spdlog::warn("Failed to disable mouse reporting");
        return false;
    }
    spdlog::debug("Mouse reporting disabled");
    return true;
}

bool PlatformDetector::WriteSequence(const std::string& sequence) {
    try {
        return m_output.Write(sequence);
    } catch (const std::exception& e) {
        spdlog::warn("Terminal output error: {}", e.what());
        return false;
    }
}

bool PlatformDetector::IsConfigured() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configured;
}

bool PlatformDetector::TestMouseFunctionality() {
    return DetectCapabilities().supportLevel != SupportLevel::None;
}

std::vector<std::string> PlatformDetector::Recommendations() {
    const ProtocolSupport support = DetectCapabilities();
    std::vector<std::string> recommendations;

    if (support.isWSL) {
        recommendations.emplace_back("WSL detected: mouse support may be limited in some terminals");
        recommendations.emplace_back("Recommend using Windows Terminal or the VS Code integrated terminal");
    }
    if (support.isContainer) {
        recommendations.emplace_back("Container detected: mouse support depends on the host terminal");
        recommendations.emplace_back("Ensure the container has appropriate terminal capabilities (TERM)");
    }
    if (support.supportLevel == SupportLevel::Minimal) {
        recommendations.emplace_back("Limited mouse support: only basic click events are available");
    } else if (support.supportLevel == SupportLevel::None) {
        recommendations.emplace_back("No mouse support detected: the terminal may not report mouse events");
        recommendations.emplace_back("Try a modern terminal emulator such as Windows Terminal, iTerm2 or GNOME Terminal");
    }
    if (support.platform == OsFamily::Unknown) {
        recommendations.emplace_back("Unknown platform: mouse support may be unpredictable");
    }
    return recommendations;
}

const char* ToString(OsFamily os) {
    switch (os) {
        case OsFamily::Windows: return "windows";
        case OsFamily::Darwin:  return "darwin";
        case OsFamily::Linux:   return "linux";
        case OsFamily::Unknown: return "unknown";
    }
    return "unknown";
}

const char* ToString(MouseProtocol protocol) {
    switch (protocol) {
        case MouseProtocol::Sgr:   return "sgr";
        case MouseProtocol::Utf8:  return "utf8";
        case MouseProtocol::Urxvt: return "urxvt";
    }
    return "unknown";
}

const char* ToString(SupportLevel level) {
    switch (level) {
        case SupportLevel::None:    return "none";
        case SupportLevel::Minimal: return "minimal";
        case SupportLevel::Partial: return "partial";
        case SupportLevel::Full:    return "full";
    }
    return "unknown";
}

} // namespace TerminalMouse::Platform
