#include "ui/MouseHandler.h"
#include "ui/ComponentRegistry.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <exception>
#include <iterator>

namespace TerminalMouse::UI {

using Terminal::MouseButton;
using Terminal::MouseEvent;
using Terminal::MouseEventType;

MouseHandler::MouseHandler(const Core::Config& config,
                           const Platform::IPlatformProbe& probe,
                           Platform::ITerminalOutput& output,
                           const Core::IClock& clock)
    : m_config(config.GetIntegration())
    , m_parser(config.GetParser(), clock)
    , m_optimizer(config.GetOptimizer(), clock)
    , m_detector(std::make_unique<Platform::PlatformDetector>(probe, output))
{
}

MouseHandler::~MouseHandler() {
    Cleanup();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool MouseHandler::Enable() {
    if (m_enabled) {
        return true;
    }
    if (!m_config.enabled) {
        spdlog::info("Mouse support disabled by configuration");
        return false;
    }

    try {
        if (m_config.autoDetect) {
            const Platform::ProtocolSupport support = m_detector->DetectCapabilities();
            if (support.supportLevel == Platform::SupportLevel::None) {
                spdlog::info("No mouse support detected for TERM='{}'", support.terminal.term);
                return false;
            }
        }
        m_enabled = m_detector->Configure();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to enable mouse support: {}", e.what());
        m_enabled = false;
    }

    if (m_config.debug) {
        spdlog::debug("Mouse support {}", m_enabled ? "enabled" : "failed to enable");
    }
    return m_enabled;
}

void MouseHandler::Disable() {
    if (!m_enabled) {
        return;
    }
    m_detector->Disable();
    m_enabled = false;
    m_optimizer.Dispose();
    spdlog::debug("Mouse support disabled");
}

bool MouseHandler::Toggle() {
    if (m_enabled) {
        Disable();
        return false;
    }
    return Enable();
}

void MouseHandler::Cleanup() {
    Disable();
    m_optimizer.Dispose();
    m_pending.clear();
    m_state = MouseState{};
}

// ============================================================================
// Input processing
// ============================================================================

bool MouseHandler::IsWithinBounds(const MouseEvent& event) const {
    if (!m_config.validateBounds) {
        return true;
    }
    if (m_width && event.coordinates.x >= *m_width) {
        return false;
    }
    if (m_height && event.coordinates.y >= *m_height) {
        return false;
    }
    return true;
}

MouseHandler::InputResult MouseHandler::ProcessInput(std::string_view chunk) {
    InputResult result;
    if (!m_enabled) {
        result.remainder = TakePendingInput();
        result.remainder.append(chunk);
        return result;
    }

    std::string buffer = std::move(m_pending);
    m_pending.clear();
    buffer.append(chunk);

    const std::size_t held = m_parser.IncompleteSuffixLength(buffer);
    if (held > 0 && held <= m_config.maxPendingBytes) {
        m_pending = buffer.substr(buffer.size() - held);
        buffer.resize(buffer.size() - held);
    }

    Terminal::MouseProtocolParser::Extraction extraction = m_parser.Extract(buffer);
    m_decodeFailures += static_cast<std::size_t>(extraction.decodeFailures);
    result.remainder = std::move(extraction.remainder);

    for (const MouseEvent& event : extraction.events) {
        if (!IsWithinBounds(event)) {
            ++m_outOfBounds;
            if (m_config.debug) {
                spdlog::debug("Event outside terminal bounds: {},{}", event.coordinates.x, event.coordinates.y);
            }
            continue;
        }
        UpdateMouseState(event);
        Input::EventBatch accepted = m_optimizer.Optimize(event);
        std::move(accepted.begin(), accepted.end(), std::back_inserter(result.events));
    }

    Input::EventBatch due = m_optimizer.Tick();
    std::move(due.begin(), due.end(), std::back_inserter(result.events));

    DeliverBatch(result.events);
    if (m_config.debug && !result.events.empty()) {
        spdlog::debug("Delivered {} mouse events", result.events.size());
    }
    return result;
}

Input::EventBatch MouseHandler::Tick() {
    if (!m_enabled) {
        return {};
    }
    Input::EventBatch batch = m_optimizer.Tick();
    DeliverBatch(batch);
    return batch;
}

std::optional<Core::SteadyTimePoint> MouseHandler::NextDeadline() const {
    return m_optimizer.NextDeadline();
}

std::string MouseHandler::TakePendingInput() {
    std::string pending;
    pending.swap(m_pending);
    return pending;
}

bool MouseHandler::ContainsMouseSequences(std::string_view data) const {
    return m_parser.LooksLikeMouseSequence(data);
}

// ============================================================================
// Mouse state
// ============================================================================

void MouseHandler::UpdateMouseState(const MouseEvent& event) {
    m_state.position = event.coordinates;
    m_state.modifiers = event.modifiers;

    const bool wheel = event.button == MouseButton::ScrollUp || event.button == MouseButton::ScrollDown;
    auto& pressed = m_state.pressedButtons;
    DragState& drag = m_state.drag;

    switch (event.type) {
        case MouseEventType::Click:
        case MouseEventType::DragStart:
            if (wheel) {
                break;
            }
            if (std::find(pressed.begin(), pressed.end(), event.button) == pressed.end()) {
                pressed.push_back(event.button);
            }
            if (!drag.isDragging) {
                drag = DragState{true, event.coordinates, event.coordinates, event.button};
            }
            break;
        case MouseEventType::Move:
        case MouseEventType::Drag:
            if (drag.isDragging) {
                drag.currentPosition = event.coordinates;
            }
            break;
        case MouseEventType::DragEnd:
            pressed.erase(std::remove(pressed.begin(), pressed.end(), event.button), pressed.end());
            if (pressed.empty()) {
                drag = DragState{};
            }
            break;
        case MouseEventType::Scroll:
        case MouseEventType::Hover:
        case MouseEventType::Leave:
            break;
    }
}

double MouseHandler::GetDragDistance() const {
    const DragState& drag = m_state.drag;
    if (!drag.startPosition || !drag.currentPosition) {
        return 0.0;
    }
    const double dx = drag.currentPosition->x - drag.startPosition->x;
    const double dy = drag.currentPosition->y - drag.startPosition->y;
    return std::sqrt(dx * dx + dy * dy);
}

bool MouseHandler::IsDragThresholdExceeded() const {
    return GetDragDistance() > static_cast<double>(m_config.dragThreshold);
}

void MouseHandler::ResetState() {
    m_state = MouseState{};
    m_pending.clear();
    m_optimizer.ResetMetrics();
    m_decodeFailures = 0;
    m_outOfBounds = 0;
}

// ============================================================================
// Dispatch
// ============================================================================

void MouseHandler::SetEventHandlers(MouseEventHandlers handlers) {
    m_handlers = std::move(handlers);
}

void MouseHandler::AttachRegistry(ComponentRegistry* registry) {
    m_registry = registry;
    if (m_registry && m_width && m_height) {
        m_registry->SetTerminalBounds(*m_width, *m_height);
    }
}

void MouseHandler::SetTerminalSize(int width, int height) {
    m_width = width;
    m_height = height;
    if (m_registry) {
        m_registry->SetTerminalBounds(width, height);
    }
}

void MouseHandler::ResolveTarget(MouseEvent& event) const {
    if (!m_registry) {
        return;
    }
    const ClickableRegion* region = m_registry->FindAt(event.coordinates.x, event.coordinates.y);
    if (!region) {
        event.target.reset();
        return;
    }
    Terminal::MouseEventTarget target;
    target.componentId = region->id;
    target.elementType = ToString(region->type);
    target.localCoordinates = {event.coordinates.x - region->bounds.x, event.coordinates.y - region->bounds.y};
    target.canHandle = region->handlers.For(event.type) != nullptr;
    event.target = std::move(target);
}

void MouseHandler::DeliverBatch(Input::EventBatch& batch) {
    for (auto& event : batch) {
        ResolveTarget(*event);
        DispatchResolved(*event);
    }
}

void MouseHandler::Dispatch(const MouseEvent& event) {
    if (m_registry && !event.target) {
        MouseEvent resolved = event;
        ResolveTarget(resolved);
        DispatchResolved(resolved);
        return;
    }
    DispatchResolved(event);
}

void MouseHandler::DispatchResolved(const MouseEvent& event) {
    const MouseEventCallback* handler = nullptr;
    switch (event.type) {
        case MouseEventType::Click:     handler = &m_handlers.onClick; break;
        case MouseEventType::DragStart: handler = &m_handlers.onDragStart; break;
        case MouseEventType::Drag:      handler = &m_handlers.onDrag; break;
        case MouseEventType::DragEnd:   handler = &m_handlers.onDragEnd; break;
        case MouseEventType::Scroll:    handler = &m_handlers.onScroll; break;
        case MouseEventType::Move:      handler = &m_handlers.onMove; break;
        case MouseEventType::Hover:     handler = &m_handlers.onHover; break;
        case MouseEventType::Leave:     handler = &m_handlers.onLeave; break;
    }

    try {
        // Handlers run from copies; a callback may replace the handlers or
        // unregister the region that owns it
        if (handler && *handler) {
            MouseEventCallback callback = *handler;
            callback(event);
        }
        if (m_registry && event.target && event.target->canHandle) {
            const ClickableRegion* region = m_registry->Get(event.target->componentId);
            const RegionEventHandler* regionHandler = region ? region->handlers.For(event.type) : nullptr;
            if (regionHandler && *regionHandler) {
                RegionEventHandler callback = *regionHandler;
                callback(event);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Mouse {} handler threw: {}", Terminal::ToString(event.type), e.what());
    }
}

// ============================================================================
// Diagnostics
// ============================================================================

std::optional<Platform::ProtocolSupport> MouseHandler::GetCapabilities() const {
    return m_detector->GetCachedCapabilities();
}

std::vector<std::string> MouseHandler::GetRecommendations() {
    return m_detector->Recommendations();
}

bool MouseHandler::TestMouseFunctionality() {
    return m_detector->TestMouseFunctionality();
}

MouseDebugInfo MouseHandler::GetDebugInfo() const {
    MouseDebugInfo info;
    info.enabled = m_enabled;
    if (auto support = m_detector->GetCachedCapabilities()) {
        info.supportLevel = support->supportLevel;
    }
    info.pendingBytes = m_pending.size();
    info.decodeFailures = m_decodeFailures;
    info.outOfBoundsEvents = m_outOfBounds;
    info.metrics = m_optimizer.GetMetrics();
    return info;
}

} // namespace TerminalMouse::UI
