// ==============================================================================
// Layer 0: Core Utility - Monotonic Clock
// ==============================================================================
// Time types shared by the trigger policy and the analysis session.
// ==============================================================================

#pragma once

#include <chrono>
#include <functional>

namespace Tactile {
namespace DSP {

using MonotonicClock = std::chrono::steady_clock;
using TimePoint = MonotonicClock::time_point;
using Milliseconds = std::chrono::milliseconds;

/// @brief Source of "now" for debounce decisions
///
/// Sessions call this once per buffer on the audio thread, so implementations
/// must be real-time safe. Tests substitute a manually advanced clock.
using ClockFunction = std::function<TimePoint()>;

/// @brief The default clock: std::chrono::steady_clock::now
[[nodiscard]] inline ClockFunction systemClock() {
    return [] { return MonotonicClock::now(); };
}

} // namespace DSP
} // namespace Tactile
