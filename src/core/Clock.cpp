#include "core/Clock.h"

namespace TerminalMouse::Core {

const IClock& SteadyClock::Instance() {
    static const SteadyClock clock;
    return clock;
}

} // namespace TerminalMouse::Core
