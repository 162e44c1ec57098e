#pragma once

#include "core/Clock.h"
#include <optional>
#include <string>

namespace TerminalMouse::Terminal {

enum class MouseEventType {
    Click,
    DragStart,
    Drag,
    DragEnd,
    Scroll,
    Move,
    Hover,
    Leave
};

enum class MouseButton {
    Left,
    Middle,
    Right,
    ScrollUp,
    ScrollDown
};

// Zero-based cell coordinates
struct MouseCoordinates {
    int x = 0;
    int y = 0;

    bool operator==(const MouseCoordinates& other) const { return x == other.x && y == other.y; }
    bool operator!=(const MouseCoordinates& other) const { return !(*this == other); }
};

struct MouseModifiers {
    bool shift = false;
    bool ctrl = false;
    bool alt = false;
    bool meta = false;   // Never reported by the wire formats

    bool operator==(const MouseModifiers& other) const {
        return shift == other.shift && ctrl == other.ctrl && alt == other.alt && meta == other.meta;
    }
};

// Region an event landed on, resolved against the component registry
struct MouseEventTarget {
    std::string componentId;
    std::string elementType;
    MouseCoordinates localCoordinates;  // Relative to the region's top-left corner
    bool canHandle = false;
};

struct MouseEvent {
    MouseEventType type = MouseEventType::Click;
    MouseCoordinates coordinates;
    MouseButton button = MouseButton::Left;
    MouseModifiers modifiers;
    Core::SteadyTimePoint timestamp;
    std::string rawSequence;            // Empty when the event was not decoded from input
    std::optional<MouseEventTarget> target;
};

const char* ToString(MouseEventType type);
const char* ToString(MouseButton button);

} // namespace TerminalMouse::Terminal
