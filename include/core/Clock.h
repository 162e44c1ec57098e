#pragma once

#include <chrono>

namespace TerminalMouse::Core {

using SteadyTimePoint = std::chrono::steady_clock::time_point;
using Milliseconds = std::chrono::milliseconds;

/**
 * @brief Abstract monotonic time source
 *
 * Injected into every component that timestamps or throttles events so
 * tests can drive time deterministically.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual SteadyTimePoint Now() const = 0;
};

/**
 * @brief IClock backed by std::chrono::steady_clock
 */
class SteadyClock : public IClock {
public:
    SteadyTimePoint Now() const override { return std::chrono::steady_clock::now(); }

    /**
     * @brief Process-wide instance used when no clock is injected
     */
    static const IClock& Instance();
};

// Fractional milliseconds between two time points
inline double ElapsedMs(SteadyTimePoint from, SteadyTimePoint to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace TerminalMouse::Core
