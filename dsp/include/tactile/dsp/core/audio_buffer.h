// ==============================================================================
// Layer 0: Core Utility - Audio Buffer View
// ==============================================================================
// Non-owning view of one mono analysis-channel buffer as delivered by an
// audio source callback. The samples are only valid for the duration of the
// callback; nothing downstream may retain the pointer.
// ==============================================================================

#pragma once

#include <bit>
#include <cstddef>

namespace Tactile {
namespace DSP {

/// @brief Read-only view of a single analysis-channel audio buffer
struct AudioBufferView {
    const float* samples = nullptr;  ///< Mono analysis-channel samples
    size_t numFrames = 0;            ///< Number of valid samples
    double sampleRate = 0.0;         ///< Sample rate in Hz

    /// @brief True if the view points at data with a positive frame count and rate
    [[nodiscard]] constexpr bool isValid() const noexcept {
        return samples != nullptr && numFrames > 0 && sampleRate > 0.0;
    }

    /// @brief True if the frame count is usable by a radix-2 transform
    [[nodiscard]] constexpr bool isPowerOfTwo() const noexcept {
        return std::has_single_bit(numFrames);
    }

    /// @brief Buffer duration in seconds (0 for an invalid view)
    [[nodiscard]] constexpr double durationSeconds() const noexcept {
        return sampleRate > 0.0 ? static_cast<double>(numFrames) / sampleRate : 0.0;
    }
};

} // namespace DSP
} // namespace Tactile
