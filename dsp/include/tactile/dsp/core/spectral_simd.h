// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Bulk windowing, energy and power-spectrum kernels using Google Highway for
// runtime SIMD dispatch (SSE2/AVX2/AVX-512/NEON).
//
// These are the vectorized inner loops of the per-buffer analysis path:
// LoudnessEstimator uses sumOfSquares(), SpectralAnalyzer uses
// multiplyBulk() for windowing and computePowerSpectrumPffft() after the FFT.
//
// Real-time safety: noexcept, no allocations.
// ==============================================================================

#pragma once

#include <cstddef>

namespace Tactile {
namespace DSP {

/// @brief Element-wise product: output[i] = a[i] * b[i]
/// @param a First input array
/// @param b Second input array
/// @param output Output array (must hold count floats, may alias a)
/// @param count Number of elements
/// @note SIMD-accelerated with runtime ISA dispatch
void multiplyBulk(const float* a, const float* b, float* output,
                  std::size_t count) noexcept;

/// @brief Sum of squared samples: sum(x[i]^2)
/// @param data Input array
/// @param count Number of elements
/// @return Sum of squares, 0 for count == 0
/// @note SIMD-accelerated with runtime ISA dispatch
[[nodiscard]] float sumOfSquares(const float* data, std::size_t count) noexcept;

/// @brief In-place power spectrum for pffft ordered real-FFT output
///
/// Computes |X(k)|^2 for each bin in pffft's ordered format:
///   [DC, Nyquist, Re(1), Im(1), Re(2), Im(2), ...]
/// After: DC^2, Nyquist^2, and each complex bin becomes [Re^2+Im^2, 0].
///
/// @param spectrum pffft ordered spectrum buffer (modified in-place, must be SIMD-aligned)
/// @param fftSize  FFT size (number of floats in the buffer)
/// @note SIMD-accelerated with runtime ISA dispatch
void computePowerSpectrumPffft(float* spectrum, std::size_t fftSize) noexcept;

} // namespace DSP
} // namespace Tactile
