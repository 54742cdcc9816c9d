// ==============================================================================
// Layer 3: System - Analysis Configuration
// ==============================================================================
// Tuning constants for one analysis session. Copied into the session at
// construction and immutable from then on.
// ==============================================================================

#pragma once

#include "tactile/dsp/core/monotonic_clock.h"
#include "tactile/dsp/core/window_functions.h"
#include "tactile/dsp/processors/haptic_parameter_mapper.h"
#include "tactile/dsp/processors/spectral_analyzer.h"
#include "tactile/dsp/processors/trigger_policy.h"

#include <cstddef>

namespace Tactile {
namespace DSP {

/// @brief Session tuning
///
/// The defaults are the shipped tuning values: 1024-sample analysis buffers,
/// 0.2 RMS gate, 100 ms debounce, 60/120 Hz sharpness bands, 0.5 s pulses.
struct AnalysisConfig {
    /// Analysis length the spectral scratch memory is sized for. Buffers of
    /// any other length are still metered for loudness but yield 0 Hz.
    size_t frameCount = SpectralAnalyzer::kDefaultFrameCount;

    WindowNormalization window = WindowNormalization::Energy;

    float loudnessGate = TriggerPolicy::kDefaultLoudnessGate;

    MonotonicClock::duration debounceInterval = TriggerPolicy::kDefaultDebounceInterval;

    /// Sharpness bands and pulse shape; loudnessGate above overrides the
    /// mapping's own gate so the trigger and the intensity ramp agree
    HapticMappingParams mapping{};

    /// Pending emissions held between the audio thread and the dispatch
    /// thread; further triggers are dropped while it is full
    size_t dispatchQueueCapacity = 16;

    /// @brief False for settings no session can run with
    /// @note A non-power-of-two frameCount is valid: spectral analysis then
    ///       degrades to 0 Hz for the whole session
    [[nodiscard]] bool isValid() const noexcept {
        return frameCount > 0 &&
               loudnessGate >= 0.0f &&
               debounceInterval.count() >= 0 &&
               mapping.intensityGain > 0.0f &&
               mapping.lowBandUpperHz <= mapping.midBandUpperHz &&
               mapping.duration > 0.0f &&
               mapping.relativeStart >= 0.0f &&
               dispatchQueueCapacity > 0;
    }

    [[nodiscard]] TriggerPolicy triggerPolicy() const noexcept {
        return TriggerPolicy{loudnessGate, debounceInterval};
    }

    [[nodiscard]] HapticParameterMapper parameterMapper() const noexcept {
        HapticMappingParams params = mapping;
        params.loudnessGate = loudnessGate;
        return HapticParameterMapper{params};
    }
};

} // namespace DSP
} // namespace Tactile
