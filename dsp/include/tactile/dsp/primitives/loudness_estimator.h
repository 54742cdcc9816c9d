// ==============================================================================
// Layer 1: DSP Primitive - Loudness Estimator
// ==============================================================================
// Root-mean-square energy of one audio buffer.
//
// Real-time safety: stateless, noexcept, no allocations.
// ==============================================================================

#pragma once

#include "tactile/dsp/core/audio_buffer.h"
#include "tactile/dsp/core/spectral_simd.h"

#include <cmath>
#include <cstddef>

namespace Tactile {
namespace DSP {

/// @brief Stateless RMS loudness estimator
///
/// rms = sqrt(sum(x_i^2) / frameCount). A buffer with no frames (or no data)
/// has an RMS of 0; the estimator never divides by zero.
class LoudnessEstimator {
public:
    /// @brief RMS of raw samples
    /// @param samples Sample data (may be nullptr when numFrames == 0)
    /// @param numFrames Number of samples
    [[nodiscard]] static float rms(const float* samples, size_t numFrames) noexcept {
        if (samples == nullptr || numFrames == 0) return 0.0f;

        const float meanSquare = sumOfSquares(samples, numFrames) /
                                 static_cast<float>(numFrames);
        return std::sqrt(meanSquare);
    }

    /// @brief RMS of a buffer view
    [[nodiscard]] static float rms(const AudioBufferView& buffer) noexcept {
        return rms(buffer.samples, buffer.numFrames);
    }
};

} // namespace DSP
} // namespace Tactile
