// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Spectral Math
// ==============================================================================
// Windowing, energy and power-spectrum kernels using Google Highway for
// runtime SIMD dispatch (SSE2/AVX2/AVX-512/NEON).
//
// This file uses Highway's self-inclusion pattern: foreach_target.h re-includes
// this file once per ISA target. The SIMD kernels compile for each target;
// HWY_EXPORT/HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE) select the best at
// runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "tactile/dsp/core/spectral_simd.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion
#include "hwy/highway.h"

#include <cstddef>

// =============================================================================
// Per-Target SIMD Kernels (compiled once per ISA target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Tactile {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// -----------------------------------------------------------------------------
// MultiplyImpl: output[i] = a[i] * b[i]
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void MultiplyImpl(const float* a, const float* b, float* output, size_t count) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        const auto va = hn::LoadU(d, a + k);
        const auto vb = hn::LoadU(d, b + k);
        hn::StoreU(hn::Mul(va, vb), d, output + k);
    }
    // Scalar tail
    for (; k < count; ++k) {
        output[k] = a[k] * b[k];
    }
}

// -----------------------------------------------------------------------------
// SumOfSquaresImpl: sum(x[i]^2)
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
float SumOfSquaresImpl(const float* HWY_RESTRICT data, size_t count) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    auto acc = hn::Zero(d);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        const auto v = hn::LoadU(d, data + k);
        acc = hn::MulAdd(v, v, acc);
    }

    float sum = hn::ReduceSum(d, acc);
    // Scalar tail
    for (; k < count; ++k) {
        sum += data[k] * data[k];
    }
    return sum;
}

// -----------------------------------------------------------------------------
// ComputePowerSpectrumPffftImpl: in-place |X(k)|^2 for pffft ordered format
// -----------------------------------------------------------------------------
// pffft ordered real output: [DC, Nyquist, Re(1), Im(1), Re(2), Im(2), ...]
// Computes power spectrum in-place: Re(k) = Re(k)^2 + Im(k)^2, Im(k) = 0

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ComputePowerSpectrumPffftImpl(float* HWY_RESTRICT spectrum, size_t fftSize) {
    // DC and Nyquist are real-only (scalar)
    spectrum[0] = spectrum[0] * spectrum[0];
    spectrum[1] = spectrum[1] * spectrum[1];

    // Complex bins 1..fftSize/2-1 are interleaved [Re, Im] starting at index 2
    const size_t numComplexBins = fftSize / 2 - 1;
    float* complexStart = spectrum + 2;

    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto zero = hn::Zero(d);

    size_t k = 0;
    for (; k + N <= numComplexBins; k += N) {
        hn::Vec<decltype(d)> re;
        hn::Vec<decltype(d)> im;
        hn::LoadInterleaved2(d, complexStart + k * 2, re, im);

        const auto power = hn::MulAdd(im, im, hn::Mul(re, re));
        hn::StoreInterleaved2(power, zero, d, complexStart + k * 2);
    }

    // Scalar tail for remaining bins
    for (; k < numComplexBins; ++k) {
        const float re = complexStart[k * 2];
        const float im = complexStart[k * 2 + 1];
        complexStart[k * 2] = re * re + im * im;
        complexStart[k * 2 + 1] = 0.0f;
    }
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Tactile

HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch Table + Wrapper Functions (compiled once)
// =============================================================================

#if HWY_ONCE

#include "tactile/dsp/core/spectral_simd.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Tactile {
namespace DSP {

HWY_EXPORT(MultiplyImpl);
HWY_EXPORT(SumOfSquaresImpl);
HWY_EXPORT(ComputePowerSpectrumPffftImpl);

void multiplyBulk(const float* a, const float* b, float* output,
                  std::size_t count) noexcept {
    if (a == nullptr || b == nullptr || output == nullptr || count == 0) return;
    HWY_DYNAMIC_DISPATCH(MultiplyImpl)(a, b, output, count);
}

float sumOfSquares(const float* data, std::size_t count) noexcept {
    if (data == nullptr || count == 0) return 0.0f;
    return HWY_DYNAMIC_DISPATCH(SumOfSquaresImpl)(data, count);
}

void computePowerSpectrumPffft(float* spectrum, std::size_t fftSize) noexcept {
    if (spectrum == nullptr || fftSize < 2) return;
    HWY_DYNAMIC_DISPATCH(ComputePowerSpectrumPffftImpl)(spectrum, fftSize);
}

}  // namespace DSP
}  // namespace Tactile

#endif  // HWY_ONCE
