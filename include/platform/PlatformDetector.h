#pragma once

#include "platform/IPlatformProbe.h"
#include "platform/ITerminalOutput.h"
#include "terminal/MouseEvent.h"
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace TerminalMouse::Platform {

enum class OsFamily {
    Windows,
    Darwin,
    Linux,
    Unknown
};

enum class MouseProtocol {
    Sgr,
    Utf8,
    Urxvt
};

enum class SupportLevel {
    None,
    Minimal,
    Partial,
    Full
};

// Terminal identification gathered during detection
struct TerminalInfo {
    std::string term;
    std::string termProgram;
    std::string colorTerm;
    std::string termInfo;
    std::string longName;
    bool windowsTerminalSession = false;   // WT_SESSION is set
};

struct ProtocolSupport {
    OsFamily platform = OsFamily::Unknown;
    bool isWSL = false;
    bool isContainer = false;
    std::vector<MouseProtocol> supportedProtocols;
    Terminal::MouseCoordinates maxCoordinates{9999, 9999};
    SupportLevel supportLevel = SupportLevel::None;
    TerminalInfo terminal;

    bool Supports(MouseProtocol protocol) const;
};

// Reporting modes chosen for the detected terminal
struct ProtocolConfiguration {
    MouseProtocol mode = MouseProtocol::Urxvt;
    bool enableTracking = true;
    bool enableButtons = false;
    bool enableMotion = false;
    bool enableFocus = false;
};

/**
 * @brief Detects terminal mouse capabilities and toggles reporting modes
 *
 * Detection runs once on a background task; every caller, including callers
 * arriving while it is still running, receives the same result. Probe
 * failures are logged and reported as SupportLevel::None.
 *
 * Configure() and Disable() write DEC private mode sequences to the injected
 * output and are safe to call repeatedly.
 */
class PlatformDetector {
public:
    PlatformDetector(const IPlatformProbe& probe, ITerminalOutput& output);
    ~PlatformDetector();

    PlatformDetector(const PlatformDetector&) = delete;
    PlatformDetector& operator=(const PlatformDetector&) = delete;

    /**
     * @brief Start detection if needed and return the shared in-flight result
     */
    std::shared_future<ProtocolSupport> DetectCapabilitiesAsync();

    /**
     * @brief Blocking form of DetectCapabilitiesAsync()
     */
    ProtocolSupport DetectCapabilities();

    /**
     * @brief Detection result if it has completed, without waiting
     */
    std::optional<ProtocolSupport> GetCachedCapabilities() const;

    /**
     * @brief Preferred reporting modes: SGR, then UTF-8, then urxvt
     */
    ProtocolConfiguration OptimalProtocol();

    /**
     * @brief Enable mouse reporting on the terminal
     * @return false if the terminal has no mouse support or the write failed
     */
    bool Configure();

    /**
     * @brief Write the disable sequence for every mode and protocol variant
     *
     * Writes nothing when detection found no mouse support.
     * @return false if the write failed
     */
    bool Disable();

    bool IsConfigured() const;

    /**
     * @brief True when detection found any level of mouse support
     */
    bool TestMouseFunctionality();

    /**
     * @brief Human-readable advice for the detected environment
     */
    std::vector<std::string> Recommendations();

private:
    ProtocolSupport RunDetection() const;
    OsFamily DetectOsFamily() const;
    bool DetectWSL(OsFamily os) const;
    bool DetectContainer() const;
    TerminalInfo DetectTerminal() const;
    std::string Env(const char* name) const;
    bool WriteSequence(const std::string& sequence);

    const IPlatformProbe& m_probe;
    ITerminalOutput& m_output;

    mutable std::mutex m_mutex;
    std::shared_future<ProtocolSupport> m_detection;
    bool m_configured = false;
};

// Pure decision functions, exposed for testing
std::vector<MouseProtocol> DetectSupportedProtocols(const TerminalInfo& terminal);
Terminal::MouseCoordinates MaxCoordinatesFor(const TerminalInfo& terminal);
SupportLevel DetermineSupportLevel(bool isWSL, bool isContainer, const TerminalInfo& terminal);
ProtocolConfiguration ChooseProtocol(const ProtocolSupport& support);

const char* ToString(OsFamily os);
const char* ToString(MouseProtocol protocol);
const char* ToString(SupportLevel level);

} // namespace TerminalMouse::Platform
