// ==============================================================================
// Layer 2: DSP Processor - Haptic Parameter Mapper
// ==============================================================================
// Converts buffer loudness and dominant frequency into the intensity,
// sharpness and duration of one continuous haptic pulse.
//
// Real-time safety: pure, noexcept, no allocations.
// ==============================================================================

#pragma once

#include "tactile/dsp/core/haptic_event.h"

#include <algorithm>

namespace Tactile {
namespace DSP {

/// @brief Mapping constants for HapticParameterMapper
struct HapticMappingParams {
    float loudnessGate = 0.2f;        ///< RMS mapped to intensity 0
    float intensityGain = 2.0f;       ///< Intensity per unit RMS above the gate
    float lowBandUpperHz = 60.0f;     ///< Below this: low-band sharpness
    float midBandUpperHz = 120.0f;    ///< Below this (and >= low edge): mid-band sharpness
    float lowBandSharpness = 0.1f;    ///< Bass: dull texture
    float midBandSharpness = 0.3f;
    float highBandSharpness = 1.0f;   ///< Everything at or above midBandUpperHz
    float duration = 0.5f;            ///< Pulse length in seconds
    float relativeStart = 0.0f;       ///< Pulse offset in seconds
};

/// @brief Pure mapping from (rms, frequency) to a HapticEvent
///
/// - intensity = clamp((rms - gate) * gain, 0, 1): the span from the gate to
///   gate + 1/gain covers the full intensity range
/// - sharpness is a step function of frequency with half-open bands
///   [0, low), [low, mid), [mid, inf)
/// - duration and relativeStart are fixed
///
/// Loudness at or below the gate is filtered by TriggerPolicy upstream, but
/// the mapping is defined for every rms.
class HapticParameterMapper {
public:
    constexpr HapticParameterMapper() noexcept = default;

    explicit constexpr HapticParameterMapper(const HapticMappingParams& params) noexcept
        : params_(params) {}

    [[nodiscard]] constexpr HapticEvent map(float rms, float frequencyHz) const noexcept {
        HapticEvent event;
        event.intensity = intensityFor(rms);
        event.sharpness = sharpnessFor(frequencyHz);
        event.duration = params_.duration;
        event.relativeStart = params_.relativeStart;
        return event;
    }

    [[nodiscard]] constexpr float intensityFor(float rms) const noexcept {
        const float scaled = (rms - params_.loudnessGate) * params_.intensityGain;
        // NaN compares false against both bounds; treat it as silence
        if (!(scaled > 0.0f)) return 0.0f;
        return std::min(scaled, 1.0f);
    }

    [[nodiscard]] constexpr float sharpnessFor(float frequencyHz) const noexcept {
        if (frequencyHz < params_.lowBandUpperHz) return params_.lowBandSharpness;
        if (frequencyHz < params_.midBandUpperHz) return params_.midBandSharpness;
        return params_.highBandSharpness;
    }

    [[nodiscard]] constexpr const HapticMappingParams& params() const noexcept {
        return params_;
    }

private:
    HapticMappingParams params_{};
};

} // namespace DSP
} // namespace Tactile
