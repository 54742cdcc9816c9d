// ==============================================================================
// Layer 1: DSP Primitive - Fast Fourier Transform
// ==============================================================================
// SIMD-accelerated real-input FFT via pffft (Pretty Fast FFT), producing the
// power spectrum |X(k)|^2 from DC to Nyquist.
// Uses SSE on x86/x64, NEON on ARM, with scalar fallback.
//
// Real-time safety: noexcept, allocations only in prepare().
// Backend: pffft (marton78 fork, BSD license)
// ==============================================================================

#pragma once

#include "tactile/dsp/core/spectral_simd.h"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <memory>

#include <pffft.h>

namespace Tactile {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Minimum supported FFT size (pffft real transforms need a multiple of 32)
inline constexpr size_t kMinFFTSize = 32;

/// Maximum supported FFT size
inline constexpr size_t kMaxFFTSize = 16384;

// =============================================================================
// RAII Helpers for pffft Resources
// =============================================================================

namespace detail {

struct PffftSetupDeleter {
    void operator()(PFFFT_Setup* s) const noexcept {
        if (s) pffft_destroy_setup(s);
    }
};

struct PffftAlignedDeleter {
    void operator()(void* p) const noexcept {
        if (p) pffft_aligned_free(p);
    }
};

using AlignedBuffer = std::unique_ptr<float, PffftAlignedDeleter>;

/// Allocate a SIMD-aligned float buffer via pffft
inline AlignedBuffer makeAlignedBuffer(size_t numFloats) {
    return {static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float))),
            PffftAlignedDeleter{}};
}

} // namespace detail

// =============================================================================
// FFT Class
// =============================================================================

/// @brief Real-input forward FFT producing a power spectrum (pffft backend)
///
/// @par Usage
/// @code
/// FFT fft;
/// if (!fft.prepare(1024)) { /* degraded: no spectral analysis */ }
/// std::vector<float> power(fft.numBins());
///
/// // In audio callback
/// fft.forwardPower(windowedSamples, power.data());
/// @endcode
class FFT {
public:
    FFT() noexcept = default;
    ~FFT() noexcept = default;

    // Non-copyable, movable (unique_ptr members enable default move)
    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Prepare FFT for given size (allocates pffft setup and aligned buffers)
    /// @param fftSize Power of 2 in range [kMinFFTSize, kMaxFFTSize]
    /// @return false if the size is unsupported or setup failed; the FFT is
    ///         then left unprepared and forwardPower() is a no-op
    /// @note NOT real-time safe (allocates memory)
    [[nodiscard]] bool prepare(size_t fftSize) noexcept {
        release();

        if (!isSupportedSize(fftSize)) {
            return false;
        }

        // Create pffft setup for real-valued transforms
        setup_.reset(pffft_new_setup(static_cast<int>(fftSize), PFFFT_REAL));
        if (!setup_) {
            return false;
        }

        // Allocate SIMD-aligned buffers (16-byte on SSE, as required by pffft)
        input_ = detail::makeAlignedBuffer(fftSize);
        output_ = detail::makeAlignedBuffer(fftSize);
        work_ = detail::makeAlignedBuffer(fftSize);
        if (!input_ || !output_ || !work_) {
            release();
            return false;
        }

        size_ = fftSize;
        reset();
        return true;
    }

    /// @brief Reset internal work buffers
    /// @note Real-time safe
    void reset() noexcept {
        if (input_) std::fill_n(input_.get(), size_, 0.0f);
        if (output_) std::fill_n(output_.get(), size_, 0.0f);
        if (work_) std::fill_n(work_.get(), size_, 0.0f);
    }

    // -------------------------------------------------------------------------
    // Processing (Real-Time Safe)
    // -------------------------------------------------------------------------

    /// @brief Forward FFT of N real samples, writing |X(k)|^2 for k = 0..N/2
    /// @param input N real samples
    /// @param power numBins() power values (DC to Nyquist inclusive)
    /// @pre prepare() has succeeded
    /// @note Real-time safe, noexcept. Unscaled: a full-scale bin reads (N/2)^2.
    void forwardPower(const float* input, float* power) noexcept {
        if (!isPrepared() || input == nullptr || power == nullptr) return;

        const size_t N = size_;

        // Copy input to SIMD-aligned buffer
        std::copy_n(input, N, input_.get());

        pffft_transform_ordered(setup_.get(), input_.get(), output_.get(),
                                work_.get(), PFFFT_FORWARD);

        // pffft ordered output: [DC, Nyquist, Re(1), Im(1), Re(2), Im(2), ...]
        // After the power pass: [DC^2, Nyq^2, P(1), 0, P(2), 0, ...]
        float* spectrum = output_.get();
        computePowerSpectrumPffft(spectrum, N);

        power[0] = spectrum[0];
        power[N / 2] = spectrum[1];
        for (size_t k = 1; k < N / 2; ++k) {
            power[k] = spectrum[2 * k];
        }
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    /// @brief Get configured FFT size (0 when unprepared)
    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// @brief Get number of output bins (N/2+1)
    [[nodiscard]] size_t numBins() const noexcept { return size_ > 0 ? size_ / 2 + 1 : 0; }

    /// @brief Check if prepare() has succeeded
    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0 && setup_ != nullptr; }

    /// @brief True if prepare() accepts this size
    [[nodiscard]] static constexpr bool isSupportedSize(size_t fftSize) noexcept {
        return std::has_single_bit(fftSize) && fftSize >= kMinFFTSize &&
               fftSize <= kMaxFFTSize;
    }

private:
    void release() noexcept {
        size_ = 0;
        setup_.reset();
        input_.reset();
        output_.reset();
        work_.reset();
    }

    size_t size_ = 0;
    std::unique_ptr<PFFFT_Setup, detail::PffftSetupDeleter> setup_;
    detail::AlignedBuffer input_;   // Input staging
    detail::AlignedBuffer output_;  // Ordered spectrum
    detail::AlignedBuffer work_;    // pffft work buffer
};

} // namespace DSP
} // namespace Tactile
