// ==============================================================================
// Layer 0: Core Utility - Window Functions
// ==============================================================================
// Hann window generators for spectral analysis, in plain and
// energy-normalized variants.
//
// Real-time safety: the in-place generators are noexcept and allocation free;
// only the vector factory allocates.
// ==============================================================================

#pragma once

#include "tactile/dsp/core/math_constants.h"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Tactile {
namespace DSP {

// =============================================================================
// Window Normalization
// =============================================================================

/// @brief Scaling applied to generated window coefficients
enum class WindowNormalization : uint8_t {
    None,   ///< Peak 1.0: 0.5 - 0.5*cos(2*pi*n/N)
    Energy  ///< Scaled so the mean of w[n]^2 is 1.0 (unity window energy)
};

namespace Window {

/// Energy correction for the periodic Hann window: sqrt(8/3).
/// The mean of (0.5 - 0.5*cos)^2 over a full period is 3/8.
inline constexpr float kHannEnergyScale = 1.63299316185545206546f;

// -----------------------------------------------------------------------------
// Window Generators (In-Place)
// -----------------------------------------------------------------------------

/// @brief Fill buffer with Hann window (periodic/DFT-even variant)
/// @param output Destination buffer
/// @param size Window size
/// @note Formula: 0.5 - 0.5*cos(2*pi*n/N) (periodic variant)
/// @note Real-time safe if buffer is pre-allocated
inline void generateHann(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;

    const float N = static_cast<float>(size);
    for (size_t n = 0; n < size; ++n) {
        // Periodic variant divides by N, not N-1, so the window tiles the
        // analysis frame exactly
        const float phase = kTwoPi * static_cast<float>(n) / N;
        output[n] = 0.5f - 0.5f * std::cos(phase);
    }
}

/// @brief Fill buffer with energy-normalized Hann window
/// @param output Destination buffer
/// @param size Window size
/// @note Formula: sqrt(8/3) * (0.5 - 0.5*cos(2*pi*n/N))
inline void generateHannNormalized(float* output, size_t size) noexcept {
    if (output == nullptr || size == 0) return;

    generateHann(output, size);
    for (size_t n = 0; n < size; ++n) {
        output[n] *= kHannEnergyScale;
    }
}

/// @brief Fill buffer with Hann window using the requested normalization
inline void generateHann(float* output, size_t size,
                         WindowNormalization normalization) noexcept {
    if (normalization == WindowNormalization::Energy) {
        generateHannNormalized(output, size);
    } else {
        generateHann(output, size);
    }
}

// -----------------------------------------------------------------------------
// Analysis
// -----------------------------------------------------------------------------

/// @brief Mean of squared window coefficients
/// @return sum(w[n]^2) / size, or 0 for an empty window
[[nodiscard]] inline float meanSquare(const float* window, size_t size) noexcept {
    if (window == nullptr || size == 0) return 0.0f;

    double sum = 0.0;
    for (size_t n = 0; n < size; ++n) {
        sum += static_cast<double>(window[n]) * static_cast<double>(window[n]);
    }
    return static_cast<float>(sum / static_cast<double>(size));
}

// -----------------------------------------------------------------------------
// Factory Function
// -----------------------------------------------------------------------------

/// @brief Generate Hann window coefficients (allocates vector)
/// @param size Window size
/// @param normalization Coefficient scaling
/// @return Vector of window coefficients
/// @note NOT real-time safe (allocates memory)
[[nodiscard]] inline std::vector<float> generate(
    size_t size,
    WindowNormalization normalization = WindowNormalization::Energy
) {
    std::vector<float> window(size, 0.0f);
    generateHann(window.data(), size, normalization);
    return window;
}

} // namespace Window

} // namespace DSP
} // namespace Tactile
