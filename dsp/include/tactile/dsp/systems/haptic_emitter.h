// ==============================================================================
// Layer 3: System Interface - Haptic Emitter
// ==============================================================================
// Capability interface over the platform haptic actuator driver.
// ==============================================================================

#pragma once

#include "tactile/dsp/core/haptic_event.h"

namespace Tactile {
namespace DSP {

/// @brief Platform haptic output
///
/// All methods except capabilities() are called from the session's
/// non-real-time dispatch thread or its control thread, never from the audio
/// callback, so implementations may block. emit() and emitFallbackPulse()
/// may throw; the dispatcher logs and counts the failure and carries on.
class HapticEmitter {
public:
    virtual ~HapticEmitter() = default;

    /// @brief What the hardware supports; queried once per session
    [[nodiscard]] virtual HapticCapabilities capabilities() const = 0;

    /// @brief Bring up the parametric haptic engine
    /// @return false if the engine could not be started
    [[nodiscard]] virtual bool start() = 0;

    /// @brief Shut the parametric engine down (no-op if never started)
    virtual void stop() = 0;

    /// @brief Play one continuous parametric pulse
    virtual void emit(const HapticEvent& event) = 0;

    /// @brief Play the platform's coarse, non-parametric pulse
    virtual void emitFallbackPulse() = 0;
};

} // namespace DSP
} // namespace Tactile
