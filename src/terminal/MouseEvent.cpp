#include "terminal/MouseEvent.h"

namespace TerminalMouse::Terminal {

const char* ToString(MouseEventType type) {
    switch (type) {
        case MouseEventType::Click:     return "click";
        case MouseEventType::DragStart: return "drag_start";
        case MouseEventType::Drag:      return "drag";
        case MouseEventType::DragEnd:   return "drag_end";
        case MouseEventType::Scroll:    return "scroll";
        case MouseEventType::Move:      return "move";
        case MouseEventType::Hover:     return "hover";
        case MouseEventType::Leave:     return "leave";
    }
    return "unknown";
}

const char* ToString(MouseButton button) {
    switch (button) {
        case MouseButton::Left:       return "left";
        case MouseButton::Middle:     return "middle";
        case MouseButton::Right:      return "right";
        case MouseButton::ScrollUp:   return "scroll_up";
        case MouseButton::ScrollDown: return "scroll_down";
    }
    return "unknown";
}

} // namespace TerminalMouse::Terminal
