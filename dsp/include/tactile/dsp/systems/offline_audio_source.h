// ==============================================================================
// Layer 3: System - Offline Audio Source
// ==============================================================================
// AudioSource over an in-memory mono signal. Slices the signal into
// fixed-size buffers and delivers them from a dedicated thread, either as
// fast as possible or paced at the buffer period.
// ==============================================================================

#pragma once

#include "tactile/dsp/systems/audio_source.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace Tactile {
namespace DSP {

/// @brief Stream an in-memory signal through a BufferCallback
///
/// A trailing remainder shorter than framesPerBuffer is delivered as a final
/// short buffer, as hardware engines do at end of file.
///
/// stop() is synchronous and may be called from any thread except the
/// delivery thread itself (calling it from inside the callback only requests
/// the stop).
class OfflineAudioSource final : public AudioSource {
public:
    struct Options {
        size_t framesPerBuffer = 1024;
        double sampleRate = 44100.0;
        bool paceInRealTime = false;  ///< Sleep one buffer period between callbacks
    };

    OfflineAudioSource(std::vector<float> samples, const Options& options);
    ~OfflineAudioSource() override;

    OfflineAudioSource(const OfflineAudioSource&) = delete;
    OfflineAudioSource& operator=(const OfflineAudioSource&) = delete;

    // -------------------------------------------------------------------------
    // AudioSource
    // -------------------------------------------------------------------------

    /// @return false if already started, the options are unusable, or the
    ///         delivery thread could not be created
    [[nodiscard]] bool start(BufferCallback callback) override;
    void stop() override;
    [[nodiscard]] bool isRunning() const noexcept override;

    // -------------------------------------------------------------------------
    // Extras
    // -------------------------------------------------------------------------

    /// @brief Block until every buffer has been delivered or stop() was called
    void waitUntilFinished();

    /// @brief Stream time of the buffer currently (or last) delivered
    ///
    /// Advances by framesPerBuffer / sampleRate per buffer, independent of
    /// wall-clock time, so it can drive a session clock deterministically.
    [[nodiscard]] std::chrono::nanoseconds streamPosition() const noexcept;

    [[nodiscard]] uint64_t buffersDelivered() const noexcept {
        return buffersDelivered_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    void run();
    void markFinished();

    const std::vector<float> samples_;
    const Options options_;

    BufferCallback callback_;
    std::thread thread_;

    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> running_{false};
    std::atomic<std::thread::id> deliveryThread_{};
    std::atomic<uint64_t> framesBeforeCurrent_{0};
    std::atomic<uint64_t> buffersDelivered_{0};

    std::mutex finishedMutex_;
    std::condition_variable finishedCondition_;
    bool finished_ = true;  // Nothing to wait for until start()
};

} // namespace DSP
} // namespace Tactile
