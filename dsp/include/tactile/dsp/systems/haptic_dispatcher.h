// ==============================================================================
// Layer 3: System - Haptic Dispatcher
// ==============================================================================
// Moves haptic requests off the audio thread. The audio thread posts into a
// lock-free queue; a dedicated worker thread drains it and calls the emitter,
// so a slow or blocking driver can never stall audio.
//
// The worker is also where real-time diagnostics get logged: the audio thread
// raises a flag, the worker reports the first occurrence of each kind.
// ==============================================================================

#pragma once

#include "tactile/dsp/core/haptic_event.h"
#include "tactile/dsp/primitives/spsc_queue.h"
#include "tactile/dsp/systems/haptic_emitter.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>

namespace Tactile {
namespace DSP {

// =============================================================================
// Request / Diagnostic Types
// =============================================================================

/// @brief One unit of work for the emitter
struct HapticRequest {
    enum class Kind : uint8_t {
        Event,         ///< emit(event)
        FallbackPulse  ///< emitFallbackPulse(), event ignored
    };

    Kind kind = Kind::Event;
    HapticEvent event{};
};

/// @brief Audio-thread conditions reported from the worker thread
enum class Diagnostic : uint32_t {
    InvalidBuffer       = 1u << 0,
    NotPowerOfTwo       = 1u << 1,
    FrameCountMismatch  = 1u << 2,
    AnalyzerUnavailable = 1u << 3,
    QueueOverflow       = 1u << 4
};

/// @brief Emission counters, readable from any thread
struct DispatchStatistics {
    uint64_t eventsEmitted = 0;     ///< emit() calls that returned normally
    uint64_t fallbackPulses = 0;    ///< emitFallbackPulse() calls that returned normally
    uint64_t requestsDropped = 0;   ///< Rejected by a full queue
    uint64_t requestsDiscarded = 0; ///< Still queued when the dispatcher stopped
    uint64_t emitterErrors = 0;     ///< emit()/emitFallbackPulse() threw
};

// =============================================================================
// HapticDispatcher
// =============================================================================

/// @brief Single-worker fire-and-forget executor for haptic requests
///
/// Threading:
/// - post() and raise() are called from the audio thread only (single
///   producer) and are wait-free.
/// - start()/stop() are called from the control thread.
/// - After stop() returns the worker has been joined: no emitter call is in
///   progress and none will be made; anything still queued is discarded.
class HapticDispatcher {
public:
    HapticDispatcher() noexcept = default;
    ~HapticDispatcher();

    HapticDispatcher(const HapticDispatcher&) = delete;
    HapticDispatcher& operator=(const HapticDispatcher&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle (control thread)
    // -------------------------------------------------------------------------

    /// @brief Size the request queue
    /// @note NOT real-time safe (allocates). Call before start().
    void prepare(size_t queueCapacity);

    /// @brief Spawn the worker thread delivering to `emitter`
    /// @return false if already running or the thread could not be created
    [[nodiscard]] bool start(HapticEmitter& emitter);

    /// @brief Stop and join the worker, discarding queued requests
    void stop();

    [[nodiscard]] bool isRunning() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    // -------------------------------------------------------------------------
    // Audio thread (real-time safe)
    // -------------------------------------------------------------------------

    /// @brief Queue a request for the worker
    /// @return false if the dispatcher is not running or the queue is full
    bool post(const HapticRequest& request) noexcept;

    /// @brief Flag a diagnostic for the worker to log
    void raise(Diagnostic diagnostic) noexcept;

    // -------------------------------------------------------------------------
    // Query (any thread)
    // -------------------------------------------------------------------------

    [[nodiscard]] DispatchStatistics statistics() const noexcept;

    [[nodiscard]] size_t queueCapacity() const noexcept { return queue_.capacity(); }

private:
    void run();
    void drainRequests();
    void reportDiagnostics();
    void deliver(const HapticRequest& request);
    void wake() noexcept;

    SpscQueue<HapticRequest> queue_;
    HapticEmitter* emitter_ = nullptr;
    std::thread worker_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    std::atomic<uint32_t> wakeSequence_{0};
    std::atomic<uint32_t> pendingDiagnostics_{0};
    uint32_t reportedDiagnostics_ = 0;  // Worker thread only

    std::atomic<uint64_t> eventsEmitted_{0};
    std::atomic<uint64_t> fallbackPulses_{0};
    std::atomic<uint64_t> requestsDropped_{0};
    std::atomic<uint64_t> requestsDiscarded_{0};
    std::atomic<uint64_t> emitterErrors_{0};
};

} // namespace DSP
} // namespace Tactile
