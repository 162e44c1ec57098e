#pragma once

#include "core/Clock.h"
#include "core/Config.h"
#include "input/EventOptimizer.h"
#include "platform/IPlatformProbe.h"
#include "platform/ITerminalOutput.h"
#include "platform/PlatformDetector.h"
#include "terminal/MouseEvent.h"
#include "terminal/MouseProtocolParser.h"
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TerminalMouse::UI {

class ComponentRegistry;

using MouseEventCallback = std::function<void(const Terminal::MouseEvent&)>;

/**
 * @brief Application callbacks, one per event type
 */
struct MouseEventHandlers {
    MouseEventCallback onClick;
    MouseEventCallback onDragStart;
    MouseEventCallback onDrag;
    MouseEventCallback onDragEnd;
    MouseEventCallback onScroll;
    MouseEventCallback onMove;
    MouseEventCallback onHover;
    MouseEventCallback onLeave;
};

struct DragState {
    bool isDragging = false;
    std::optional<Terminal::MouseCoordinates> startPosition;
    std::optional<Terminal::MouseCoordinates> currentPosition;
    std::optional<Terminal::MouseButton> button;
};

// Pointer state reconstructed from every decoded event, including ones the optimizer drops
struct MouseState {
    Terminal::MouseCoordinates position;
    Terminal::MouseModifiers modifiers;
    std::vector<Terminal::MouseButton> pressedButtons;
    DragState drag;

    bool IsPressed() const { return !pressedButtons.empty(); }
};

struct MouseDebugInfo {
    bool enabled = false;
    std::optional<Platform::SupportLevel> supportLevel;
    std::size_t pendingBytes = 0;
    std::size_t decodeFailures = 0;
    std::size_t outOfBoundsEvents = 0;
    Input::OptimizerMetrics metrics;
};

/**
 * @brief Connects terminal input to mouse event handlers
 *
 * Each ProcessInput() call extracts mouse reports from the chunk, strips
 * them from the returned remainder, runs the decoded events through the
 * optimizer and dispatches whatever it releases, in stream order.
 *
 * A trailing fragment that may be the start of a split report is held back
 * and prepended to the next chunk. Hosts that want it delivered as keystrokes
 * after a timeout call TakePendingInput().
 *
 * Handler exceptions are logged and never interrupt input processing.
 * The destructor calls Cleanup(), which restores the terminal.
 */
class MouseHandler {
public:
    struct InputResult {
        Input::EventBatch events;   // Delivered events, already dispatched
        std::string remainder;      // Input with mouse reports removed
    };

    MouseHandler(const Core::Config& config,
                 const Platform::IPlatformProbe& probe,
                 Platform::ITerminalOutput& output,
                 const Core::IClock& clock = Core::SteadyClock::Instance());
    ~MouseHandler();

    MouseHandler(const MouseHandler&) = delete;
    MouseHandler& operator=(const MouseHandler&) = delete;

    /**
     * @brief Detect capabilities if needed and enable reporting on the terminal
     * @return false if the terminal has no mouse support or configuration failed
     */
    bool Enable();

    /**
     * @brief Disable reporting and drop queued events; no-op when not enabled
     */
    void Disable();

    /**
     * @brief Flip between Enable() and Disable()
     * @return Whether mouse support is enabled afterwards
     */
    bool Toggle();

    /**
     * @brief Disable and release all pending state; safe to call repeatedly
     */
    void Cleanup();

    bool IsEnabled() const { return m_enabled; }

    /**
     * @brief Decode, optimize and dispatch the mouse reports in a chunk
     *
     * When disabled the chunk is returned untouched as the remainder.
     */
    InputResult ProcessInput(std::string_view chunk);

    /**
     * @brief Deliver batched events whose frame deadline has passed
     */
    Input::EventBatch Tick();

    // When Tick() next has work to do
    std::optional<Core::SteadyTimePoint> NextDeadline() const;

    // Release held-back bytes so the caller can treat them as keystrokes
    std::string TakePendingInput();
    std::size_t PendingInputSize() const { return m_pending.size(); }

    /**
     * @brief Route an event to the handler registered for its type
     *
     * Resolves the target region first when a registry is attached.
     */
    void Dispatch(const Terminal::MouseEvent& event);

    void SetEventHandlers(MouseEventHandlers handlers);

    // Registry used to resolve event targets; not owned, may be null
    void AttachRegistry(ComponentRegistry* registry);

    // Events outside this size are dropped when validateBounds is set
    void SetTerminalSize(int width, int height);

    const MouseState& GetMouseState() const { return m_state; }
    double GetDragDistance() const;
    bool IsDragThresholdExceeded() const;
    void ResetState();

    std::optional<Platform::ProtocolSupport> GetCapabilities() const;
    std::vector<std::string> GetRecommendations();
    bool TestMouseFunctionality();

    bool ContainsMouseSequences(std::string_view data) const;

    Input::OptimizerMetrics GetMetrics() const { return m_optimizer.GetMetrics(); }
    MouseDebugInfo GetDebugInfo() const;

    const Terminal::MouseProtocolParser& GetParser() const { return m_parser; }

private:
    bool IsWithinBounds(const Terminal::MouseEvent& event) const;
    void UpdateMouseState(const Terminal::MouseEvent& event);
    void ResolveTarget(Terminal::MouseEvent& event) const;
    void DeliverBatch(Input::EventBatch& batch);
    void DispatchResolved(const Terminal::MouseEvent& event);

    Core::IntegrationConfig m_config;

    Terminal::MouseProtocolParser m_parser;
    Input::EventOptimizer m_optimizer;
    std::unique_ptr<Platform::PlatformDetector> m_detector;

    MouseEventHandlers m_handlers;
    ComponentRegistry* m_registry = nullptr;

    std::optional<int> m_width;
    std::optional<int> m_height;

    MouseState m_state;
    std::string m_pending;
    bool m_enabled = false;

    std::size_t m_decodeFailures = 0;
    std::size_t m_outOfBounds = 0;
};

} // namespace TerminalMouse::UI
