#pragma once

#include "core/Config.h"

namespace TerminalMouse::Core {

/**
 * @brief Install the default spdlog logger on stderr and apply the level
 *
 * stdout carries terminal control sequences, so log output never goes there.
 * Debug mode forces the debug level regardless of config.level.
 */
void InitializeLogging(const LoggingConfig& config);

} // namespace TerminalMouse::Core
