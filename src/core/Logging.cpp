#include "core/Logging.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace TerminalMouse::Core {

void InitializeLogging(const LoggingConfig& config) {
    auto logger = spdlog::get("terminal_mouse");
    if (!logger) {
        logger = spdlog::stderr_color_mt("terminal_mouse");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    spdlog::level::level_enum level = spdlog::level::from_str(config.level);
    if (config.debug && level > spdlog::level::debug) {
        level = spdlog::level::debug;
    }
    spdlog::set_level(level);
    spdlog::debug("Logging initialized at level {}", spdlog::level::to_string_view(level));
}

} // namespace TerminalMouse::Core
