#pragma once

#include <string_view>

namespace TerminalMouse::Terminal::Sequences {

// DEC private modes controlling mouse reporting
inline constexpr std::string_view kEnableTracking = "\x1b[?1000h";
inline constexpr std::string_view kDisableTracking = "\x1b[?1000l";
inline constexpr std::string_view kEnableButtonEvents = "\x1b[?1002h";
inline constexpr std::string_view kDisableButtonEvents = "\x1b[?1002l";
inline constexpr std::string_view kEnableAnyMotion = "\x1b[?1003h";
inline constexpr std::string_view kDisableAnyMotion = "\x1b[?1003l";
inline constexpr std::string_view kEnableFocusEvents = "\x1b[?1004h";
inline constexpr std::string_view kDisableFocusEvents = "\x1b[?1004l";
inline constexpr std::string_view kEnableUtf8Mode = "\x1b[?1005h";
inline constexpr std::string_view kDisableUtf8Mode = "\x1b[?1005l";
inline constexpr std::string_view kEnableSgrMode = "\x1b[?1006h";
inline constexpr std::string_view kDisableSgrMode = "\x1b[?1006l";
inline constexpr std::string_view kEnableUrxvtMode = "\x1b[?1015h";
inline constexpr std::string_view kDisableUrxvtMode = "\x1b[?1015l";

// Button code bit fields shared by every report format
inline constexpr int kShiftBit = 4;
inline constexpr int kAltBit = 8;
inline constexpr int kCtrlBit = 16;
inline constexpr int kMotionBit = 32;
inline constexpr int kWheelBit = 64;

// Offset added to every field of a legacy/UTF-8 report
inline constexpr int kLegacyOffset = 32;
inline constexpr int kLegacyMaxCoordinate = 223;

} // namespace TerminalMouse::Terminal::Sequences
