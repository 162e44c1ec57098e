#pragma once

#include "core/Clock.h"
#include "terminal/MouseEvent.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace TerminalMouse::UI {

enum class RegionType {
    Button,
    Link,
    MenuItem,
    Input,
    Scrollable,
    Tab,
    Checkbox,
    Custom
};

enum class RegionRole {
    Button,
    Link,
    Menu,
    MenuItem,
    Tab,
    Textbox,
    Checkbox
};

// Rectangle in cell coordinates; contains [x, x+width) x [y, y+height)
struct RegionBounds {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool Contains(int px, int py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }

    bool Intersects(const RegionBounds& other) const {
        return x < other.x + other.width && other.x < x + width &&
               y < other.y + other.height && other.y < y + height;
    }

    bool operator==(const RegionBounds& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const RegionBounds& other) const { return !(*this == other); }
};

using RegionEventHandler = std::function<void(const Terminal::MouseEvent&)>;

struct RegionHandlers {
    RegionEventHandler onClick;
    RegionEventHandler onDragStart;
    RegionEventHandler onDrag;
    RegionEventHandler onDragEnd;
    RegionEventHandler onScroll;
    RegionEventHandler onHover;
    RegionEventHandler onLeave;

    // Handler for an event type, or nullptr if none is set
    const RegionEventHandler* For(Terminal::MouseEventType type) const;
};

struct RegionAccessibility {
    RegionRole role = RegionRole::Button;
    std::string label;
    std::string description;
    int tabIndex = 0;                   // -1 removes the region from tab order
    bool keyboardActivatable = true;
    std::vector<std::string> shortcuts;
};

struct RegionStyle {
    std::string cursor;
    std::string hoverStyle;
    std::string activeStyle;
};

/**
 * @brief An interactive rectangle registered with the ComponentRegistry
 */
struct ClickableRegion {
    std::string id;
    RegionType type = RegionType::Custom;
    RegionBounds bounds;
    bool isEnabled = true;
    bool isVisible = true;
    int priority = 0;                   // 0-1000; higher wins hit-tests
    RegionHandlers handlers;
    RegionAccessibility accessibility;
    std::optional<RegionStyle> style;
};

// Partial update; unset fields keep their current value
struct RegionUpdate {
    std::optional<RegionType> type;
    std::optional<RegionBounds> bounds;
    std::optional<bool> isEnabled;
    std::optional<bool> isVisible;
    std::optional<int> priority;
    std::optional<RegionHandlers> handlers;
    std::optional<RegionAccessibility> accessibility;
    std::optional<RegionStyle> style;
};

enum class RegistrationError {
    None,
    Validation,
    DuplicateId,
    NotFound
};

struct RegistrationResult {
    bool success = false;
    RegistrationError error = RegistrationError::None;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

struct ValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
};

enum class RegionChangeType {
    Added,
    Updated,
    Removed,
    Enabled,
    Disabled,
    Moved
};

struct RegionChangeEvent {
    RegionChangeType type = RegionChangeType::Added;
    std::string regionId;
    Core::SteadyTimePoint timestamp;
    std::optional<RegionBounds> previousBounds;   // Set for Moved and bounds-changing Updated
};

/**
 * @brief Checks the registration constraints of a region
 *
 * Reports every violated constraint, not just the first.
 */
ValidationResult ValidateRegion(const ClickableRegion& region);

const char* ToString(RegionType type);
const char* ToString(RegionRole role);
const char* ToString(RegionChangeType type);

} // namespace TerminalMouse::UI
