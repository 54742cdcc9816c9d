// ==============================================================================
// Layer 3: System Interface - Audio Source
// ==============================================================================
// Capability interface for whatever delivers audio buffers: a hardware
// engine's real-time callback, a decoder, or an in-memory test stream.
// ==============================================================================

#pragma once

#include "tactile/dsp/core/audio_buffer.h"

#include <functional>

namespace Tactile {
namespace DSP {

/// @brief Per-buffer callback; the view is valid only for the duration of the call
using BufferCallback = std::function<void(const AudioBufferView&)>;

/// @brief Producer of mono analysis-channel buffers
///
/// Contract for implementations:
/// - The callback is invoked on a single, consistent thread, one buffer at a
///   time, at the source's natural cadence.
/// - stop() is synchronous: when it returns, no callback is executing and
///   none will be invoked again.
/// - start() after stop() is not required to be supported.
class AudioSource {
public:
    virtual ~AudioSource() = default;

    /// @brief Open the stream and begin delivering buffers to `callback`
    /// @return false if the stream could not be started
    [[nodiscard]] virtual bool start(BufferCallback callback) = 0;

    /// @brief Halt the stream synchronously
    virtual void stop() = 0;

    [[nodiscard]] virtual bool isRunning() const noexcept = 0;
};

} // namespace DSP
} // namespace Tactile
