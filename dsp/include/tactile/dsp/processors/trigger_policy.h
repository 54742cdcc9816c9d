// ==============================================================================
// Layer 2: DSP Processor - Trigger Policy
// ==============================================================================
// Decides whether one analyzed buffer produces a haptic pulse: a fixed
// loudness gate combined with a minimum re-trigger interval.
//
// Real-time safety: noexcept, no allocations, no hidden state.
// ==============================================================================

#pragma once

#include "tactile/dsp/core/monotonic_clock.h"

#include <optional>

namespace Tactile {
namespace DSP {

/// @brief Debounce state owned by exactly one analysis session
///
/// Mutated only by TriggerPolicy::decide() on a positive decision, and only
/// from the audio thread. An empty timestamp means the policy has never fired.
struct TriggerState {
    std::optional<TimePoint> lastTriggerTimestamp;
};

/// @brief Loudness gate plus debounce interval
///
/// Fires when rms > loudnessGate AND more than debounceInterval has elapsed
/// since the last firing recorded in the supplied state. Both comparisons
/// are strict: rms exactly at the gate, or a buffer exactly one interval
/// later, does not fire.
///
/// The policy itself is immutable; all mutable state is passed in, so
/// concurrent sessions never share a debounce clock.
class TriggerPolicy {
public:
    // =========================================================================
    // Constants
    // =========================================================================

    /// RMS a buffer must exceed to trigger (filters silence and noise floor)
    static constexpr float kDefaultLoudnessGate = 0.2f;

    /// Minimum time between two firings (actuator settling time)
    static constexpr Milliseconds kDefaultDebounceInterval{100};

    // =========================================================================
    // Lifecycle
    // =========================================================================

    constexpr TriggerPolicy() noexcept = default;

    constexpr TriggerPolicy(float loudnessGate,
                            MonotonicClock::duration debounceInterval) noexcept
        : loudnessGate_(loudnessGate)
        , debounceInterval_(debounceInterval) {}

    // =========================================================================
    // Decision
    // =========================================================================

    /// @brief Decide whether to fire, recording the firing time on success
    /// @param rms Loudness of the current buffer
    /// @param now Monotonic time of the current buffer
    /// @param state Session-owned debounce state (updated only when firing)
    /// @return true if a haptic pulse should be emitted
    [[nodiscard]] bool decide(float rms, TimePoint now, TriggerState& state) const noexcept {
        if (!(rms > loudnessGate_)) {
            return false;
        }

        if (state.lastTriggerTimestamp.has_value() &&
            !(now - *state.lastTriggerTimestamp > debounceInterval_)) {
            return false;
        }

        state.lastTriggerTimestamp = now;
        return true;
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] constexpr float loudnessGate() const noexcept { return loudnessGate_; }

    [[nodiscard]] constexpr MonotonicClock::duration debounceInterval() const noexcept {
        return debounceInterval_;
    }

private:
    float loudnessGate_ = kDefaultLoudnessGate;
    MonotonicClock::duration debounceInterval_ = kDefaultDebounceInterval;
};

} // namespace DSP
} // namespace Tactile
