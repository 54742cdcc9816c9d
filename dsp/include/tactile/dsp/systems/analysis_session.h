// ==============================================================================
// Layer 3: System - Analysis Session
// ==============================================================================
// Owns one audio-to-haptics run: the spectral scratch memory, the debounce
// state, and the dispatch thread. Per buffer, on the audio thread:
//
//   buffer -> LoudnessEstimator -> SpectralAnalyzer -> TriggerPolicy
//          -> (on trigger) HapticParameterMapper -> HapticDispatcher
//
// Lifecycle: Idle -> Running -> Stopped. Stopped is terminal; construct a new
// session to run again.
// ==============================================================================

#pragma once

#include "tactile/dsp/core/audio_buffer.h"
#include "tactile/dsp/core/haptic_event.h"
#include "tactile/dsp/core/monotonic_clock.h"
#include "tactile/dsp/processors/haptic_parameter_mapper.h"
#include "tactile/dsp/processors/spectral_analyzer.h"
#include "tactile/dsp/processors/trigger_policy.h"
#include "tactile/dsp/systems/analysis_config.h"
#include "tactile/dsp/systems/audio_source.h"
#include "tactile/dsp/systems/haptic_dispatcher.h"
#include "tactile/dsp/systems/haptic_emitter.h"

#include <atomic>
#include <cstdint>
#include <mutex>

namespace Tactile {
namespace DSP {

enum class SessionState : uint8_t {
    Idle,
    Running,
    Stopped
};

/// @brief How triggers reach the emitter, fixed when the session starts
enum class EmissionMode : uint8_t {
    None,        ///< No usable haptics: analysis runs, nothing is emitted
    Parametric,  ///< HapticEvent per trigger
    Fallback     ///< Coarse platform pulse per trigger
};

/// @brief Snapshot of a session's counters
struct SessionStatistics {
    uint64_t buffersAnalyzed = 0;   ///< Buffers that reached the analysis path
    uint64_t degradedAnalyses = 0;  ///< Buffers whose spectral analysis returned 0 Hz by failure
    uint64_t triggers = 0;          ///< Positive trigger decisions
    DispatchStatistics dispatch{};
};

/// @brief Audio analysis and haptic triggering for one playback
///
/// @par Threading
/// - start()/stop() are control-thread calls (serialized internally).
/// - processBuffer() runs on the audio source's callback thread. It is
///   noexcept, lock free and allocation free; it is also the only writer of
///   the trigger state and spectral scratch.
/// - stop() may race with an in-flight processBuffer(): it halts the source,
///   waits out any callback still running, then joins the dispatch thread.
///   After stop() returns no emitter call is made.
///
/// @par Usage
/// @code
/// AnalysisSession session;               // default tuning, steady_clock
/// if (session.start(audioSource, emitter)) {
///     // ... playback ...
///     session.stop();
/// }
/// @endcode
class AnalysisSession {
public:
    /// @param config Tuning; copied and fixed for the session's lifetime
    /// @param clock Monotonic time source read once per buffer
    /// @note Allocates all scratch memory. NOT real-time safe.
    explicit AnalysisSession(const AnalysisConfig& config = AnalysisConfig{},
                             ClockFunction clock = systemClock());
    ~AnalysisSession();

    AnalysisSession(const AnalysisSession&) = delete;
    AnalysisSession& operator=(const AnalysisSession&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle (control thread)
    // -------------------------------------------------------------------------

    /// @brief Idle -> Running
    ///
    /// Queries the emitter's capabilities once, brings up its engine when
    /// fine-grained haptics are supported, starts the dispatch thread and
    /// finally the audio source with processBuffer() as its callback.
    /// The debounce interval starts counting at this call, so no buffer
    /// triggers within the first debounceInterval of the session.
    ///
    /// @return false if the session was not Idle (state unchanged), or if
    ///         the config is invalid or the audio source failed to start (the
    ///         session ends Stopped). Haptic failures do not fail start(): the
    ///         session runs with reduced or no haptic output instead.
    [[nodiscard]] bool start(AudioSource& source, HapticEmitter& emitter);

    /// @brief Running -> Stopped (Idle -> Stopped is allowed; Stopped is a no-op)
    void stop();

    [[nodiscard]] SessionState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    // -------------------------------------------------------------------------
    // Audio thread
    // -------------------------------------------------------------------------

    /// @brief Analyze one buffer and post a haptic request if it triggers
    /// @note Ignored unless the session is Running. Real-time safe.
    void processBuffer(const AudioBufferView& buffer) noexcept;

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] const AnalysisConfig& config() const noexcept { return config_; }

    /// @brief Capabilities reported by the emitter at start() (default before)
    [[nodiscard]] HapticCapabilities capabilities() const;

    [[nodiscard]] EmissionMode emissionMode() const;

    /// @brief False if the spectral analyzer could not be set up for config().frameCount
    [[nodiscard]] bool isSpectralAnalysisAvailable() const noexcept {
        return analyzer_.isPrepared();
    }

    [[nodiscard]] SessionStatistics statistics() const noexcept;

private:
    void selectEmissionMode(HapticEmitter& emitter);
    void shutdown();
    void raiseDiagnostic(SpectralAnalyzer::Status status) noexcept;
    void waitForCallbacksToDrain() const noexcept;

    const AnalysisConfig config_;
    const ClockFunction clock_;
    const TriggerPolicy policy_;
    const HapticParameterMapper mapper_;

    // Audio thread only
    SpectralAnalyzer analyzer_;
    TriggerState triggerState_;

    HapticDispatcher dispatcher_;

    // Fixed at start(), read by the audio thread after running_ is published
    HapticCapabilities capabilities_{};
    EmissionMode emissionMode_ = EmissionMode::None;
    bool emitterStarted_ = false;

    AudioSource* source_ = nullptr;
    HapticEmitter* emitter_ = nullptr;

    mutable std::mutex lifecycleMutex_;
    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<bool> running_{false};
    std::atomic<int> callbacksInFlight_{0};

    std::atomic<uint64_t> buffersAnalyzed_{0};
    std::atomic<uint64_t> degradedAnalyses_{0};
    std::atomic<uint64_t> triggers_{0};
};

} // namespace DSP
} // namespace Tactile
