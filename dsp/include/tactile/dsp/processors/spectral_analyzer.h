// ==============================================================================
// Layer 2: DSP Processor - Spectral Analyzer
// ==============================================================================
// Dominant-frequency estimation for a fixed-length analysis buffer:
// Hann window -> real FFT -> power spectrum -> peak bin -> Hz.
//
// Real-time safety: analyze() is noexcept and allocation free; all scratch
// memory (window, windowed signal, FFT buffers, power spectrum) is sized once
// in prepare().
// ==============================================================================

#pragma once

#include "tactile/dsp/core/audio_buffer.h"
#include "tactile/dsp/core/spectral_simd.h"
#include "tactile/dsp/core/window_functions.h"
#include "tactile/dsp/primitives/fft.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Tactile {
namespace DSP {

/// @brief Dominant-frequency detector over fixed-size buffers
///
/// The analyzer never fails loudly. Any buffer it cannot analyze yields 0 Hz
/// and a non-Ok lastStatus(); a missed detection must never interrupt audio.
///
/// Resolution is one bin, sampleRate / frameCount Hz. The reported frequency
/// is the lower edge of the peak bin (index * sampleRate / frameCount), so
/// callers must not expect sub-bin precision.
///
/// @par Usage
/// @code
/// SpectralAnalyzer analyzer;
/// if (!analyzer.prepare(1024)) { /* analyze() will return 0 */ }
///
/// // In audio callback
/// float hz = analyzer.analyze({samples, 1024, 48000.0});
/// @endcode
class SpectralAnalyzer {
public:
    // =========================================================================
    // Types
    // =========================================================================

    /// @brief Outcome of the most recent analyze() call
    enum class Status : uint8_t {
        Ok = 0,              ///< Peak bin found
        NotPrepared,         ///< prepare() not called or transform setup failed
        InvalidBuffer,       ///< Null samples, zero frames or non-positive sample rate
        NotPowerOfTwo,       ///< Frame count unusable by the radix-2 transform
        FrameCountMismatch   ///< Power of two, but not the prepared frame count
    };

    // =========================================================================
    // Constants
    // =========================================================================

    static constexpr size_t kDefaultFrameCount = 1024;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    SpectralAnalyzer() noexcept = default;

    /// @brief Size all scratch memory for buffers of `frameCount` samples
    /// @param frameCount Analysis length; power of two in [kMinFFTSize, kMaxFFTSize]
    /// @param normalization Hann window scaling
    /// @return false if the transform could not be set up for this length
    /// @note NOT real-time safe (allocates memory)
    [[nodiscard]] bool prepare(size_t frameCount,
                               WindowNormalization normalization =
                                   WindowNormalization::Energy) {
        frameCount_ = 0;
        lastStatus_ = Status::NotPrepared;

        if (!fft_.prepare(frameCount)) {
            window_.clear();
            windowed_.clear();
            power_.clear();
            return false;
        }

        window_ = Window::generate(frameCount, normalization);
        windowed_.assign(frameCount, 0.0f);
        power_.assign(fft_.numBins(), 0.0f);
        frameCount_ = frameCount;
        return true;
    }

    /// @brief Clear scratch contents without reallocating
    void reset() noexcept {
        std::fill(windowed_.begin(), windowed_.end(), 0.0f);
        std::fill(power_.begin(), power_.end(), 0.0f);
        fft_.reset();
        lastStatus_ = isPrepared() ? Status::Ok : Status::NotPrepared;
    }

    // =========================================================================
    // Processing (Real-Time Safe)
    // =========================================================================

    /// @brief Dominant frequency of one buffer
    /// @param buffer Analysis-channel buffer; not retained past the call
    /// @return Frequency of the peak bin in Hz, or 0 if the buffer could not
    ///         be analyzed (see lastStatus())
    [[nodiscard]] float analyze(const AudioBufferView& buffer) noexcept {
        lastStatus_ = classify(buffer);
        if (lastStatus_ != Status::Ok) {
            return 0.0f;
        }

        const size_t N = frameCount_;
        multiplyBulk(buffer.samples, window_.data(), windowed_.data(), N);
        fft_.forwardPower(windowed_.data(), power_.data());

        const size_t peak = findPeakBin(power_.data(), N / 2);
        return static_cast<float>(static_cast<double>(peak) * buffer.sampleRate /
                                  static_cast<double>(N));
    }

    /// @brief Index of the largest value in [0, numBins)
    /// @note Ties resolve to the lowest index; an all-zero spectrum yields 0
    [[nodiscard]] static size_t findPeakBin(const float* power, size_t numBins) noexcept {
        if (power == nullptr || numBins == 0) return 0;

        size_t peakIndex = 0;
        float peakValue = power[0];
        for (size_t k = 1; k < numBins; ++k) {
            if (power[k] > peakValue) {
                peakValue = power[k];
                peakIndex = k;
            }
        }
        return peakIndex;
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] bool isPrepared() const noexcept { return frameCount_ > 0; }

    /// @brief Prepared analysis length in samples (0 when unprepared)
    [[nodiscard]] size_t frameCount() const noexcept { return frameCount_; }

    [[nodiscard]] Status lastStatus() const noexcept { return lastStatus_; }

    /// @brief Width of one frequency bin in Hz at the given sample rate
    [[nodiscard]] float binWidth(double sampleRate) const noexcept {
        if (frameCount_ == 0) return 0.0f;
        return static_cast<float>(sampleRate / static_cast<double>(frameCount_));
    }

    /// @brief Power spectrum of the last analyzed buffer (numBins() values)
    [[nodiscard]] const float* powerSpectrum() const noexcept { return power_.data(); }

    [[nodiscard]] size_t numBins() const noexcept { return power_.size(); }

private:
    [[nodiscard]] Status classify(const AudioBufferView& buffer) const noexcept {
        if (!buffer.isValid()) return Status::InvalidBuffer;
        if (!buffer.isPowerOfTwo()) return Status::NotPowerOfTwo;
        if (!isPrepared()) return Status::NotPrepared;
        if (buffer.numFrames != frameCount_) return Status::FrameCountMismatch;
        return Status::Ok;
    }

    FFT fft_;
    std::vector<float> window_;    // Hann coefficients
    std::vector<float> windowed_;  // Windowed input scratch
    std::vector<float> power_;     // |X(k)|^2, DC..Nyquist
    size_t frameCount_ = 0;
    Status lastStatus_ = Status::NotPrepared;
};

} // namespace DSP
} // namespace Tactile
