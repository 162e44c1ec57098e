#include "ui/RegionTypes.h"

namespace TerminalMouse::UI {

const RegionEventHandler* RegionHandlers::For(Terminal::MouseEventType type) const {
    const RegionEventHandler* handler = nullptr;
    switch (type) {
        case Terminal::MouseEventType::Click:     handler = &onClick; break;
        case Terminal::MouseEventType::DragStart: handler = &onDragStart; break;
        case Terminal::MouseEventType::Drag:      handler = &onDrag; break;
        case Terminal::MouseEventType::DragEnd:   handler = &onDragEnd; break;
        case Terminal::MouseEventType::Scroll:    handler = &onScroll; break;
        case Terminal::MouseEventType::Hover:     handler = &onHover; break;
        case Terminal::MouseEventType::Leave:     handler = &onLeave; break;
        case Terminal::MouseEventType::Move:      return nullptr;
    }
    return (handler && *handler) ? handler : nullptr;
}

ValidationResult ValidateRegion(const ClickableRegion& region) {
    ValidationResult result;

    if (region.id.empty()) {
        result.errors.emplace_back("Component ID is required and cannot be empty");
    }
    const RegionBounds& b = region.bounds;
    if (b.width <= 0 || b.height <= 0 || b.x < 0 || b.y < 0) {
        result.errors.emplace_back(
            "Component bounds must have positive width and height, and non-negative coordinates");
    }
    if (region.priority < 0 || region.priority > 1000) {
        result.errors.emplace_back("Component priority should be between 0 and 1000");
    }
    if (region.accessibility.label.empty()) {
        result.errors.emplace_back("Accessibility label is required");
    }
    if (region.accessibility.tabIndex < -1) {
        result.errors.emplace_back("Tab index should be -1 or greater");
    }

    result.isValid = result.errors.empty();
    return result;
}

const char* ToString(RegionType type) {
    switch (type) {
        case RegionType::Button:     return "button";
        case RegionType::Link:       return "link";
        case RegionType::MenuItem:   return "menu_item";
        case RegionType::Input:      return "input";
        case RegionType::Scrollable: return "scrollable";
        case RegionType::Tab:        return "tab";
        case RegionType::Checkbox:   return "checkbox";
        case RegionType::Custom:     return "custom";
    }
    return "unknown";
}

const char* ToString(RegionRole role) {
    switch (role) {
        case RegionRole::Button:   return "button";
        case RegionRole::Link:     return "link";
        case RegionRole::Menu:     return "menu";
        case RegionRole::MenuItem: return "menuitem";
        case RegionRole::Tab:      return "tab";
        case RegionRole::Textbox:  return "textbox";
        case RegionRole::Checkbox: return "checkbox";
    }
    return "unknown";
}

const char* ToString(RegionChangeType type) {
    switch (type) {
        case RegionChangeType::Added:    return "added";
        case RegionChangeType::Updated:  return "updated";
        case RegionChangeType::Removed:  return "removed";
        case RegionChangeType::Enabled:  return "enabled";
        case RegionChangeType::Disabled: return "disabled";
        case RegionChangeType::Moved:    return "moved";
    }
    return "unknown";
}

} // namespace TerminalMouse::UI
