// ==============================================================================
// Analysis Session Implementation
// ==============================================================================

#include "analysis_session.h"

#include "tactile/dsp/core/logging.h"
#include "tactile/dsp/primitives/loudness_estimator.h"

#include <chrono>
#include <exception>
#include <thread>
#include <utility>

namespace Tactile {
namespace DSP {

namespace {

const char* toString(EmissionMode mode) noexcept {
    switch (mode) {
        case EmissionMode::None:       return "none";
        case EmissionMode::Parametric: return "parametric";
        case EmissionMode::Fallback:   return "fallback pulse";
    }
    return "unknown";
}

} // namespace

AnalysisSession::AnalysisSession(const AnalysisConfig& config, ClockFunction clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : systemClock())
    , policy_(config.triggerPolicy())
    , mapper_(config.parameterMapper()) {
    if (!analyzer_.prepare(config_.frameCount, config_.window)) {
        logger()->warn("spectral analysis unavailable for {}-frame buffers "
                       "(power of two in [{}, {}] required); dominant frequency will read 0 Hz",
                       config_.frameCount, kMinFFTSize, kMaxFFTSize);
    }
    dispatcher_.prepare(config_.dispatchQueueCapacity);
}

AnalysisSession::~AnalysisSession() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

bool AnalysisSession::start(AudioSource& source, HapticEmitter& emitter) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);

    if (state_.load(std::memory_order_acquire) != SessionState::Idle) {
        logger()->warn("analysis session can only be started once");
        return false;
    }

    if (!config_.isValid()) {
        logger()->error("invalid analysis configuration; session not started");
        state_.store(SessionState::Stopped, std::memory_order_release);
        return false;
    }

    source_ = &source;
    emitter_ = &emitter;
    selectEmissionMode(emitter);

    // The dispatch thread also reports audio-thread diagnostics, so it runs
    // even when there is nothing to emit
    if (!dispatcher_.start(emitter)) {
        logger()->error("haptic dispatch unavailable; continuing without haptic feedback");
        emissionMode_ = EmissionMode::None;
    }

    // The debounce window opens at session start: nothing fires during the
    // first interval. Written before running_ is published to the audio thread.
    triggerState_.lastTriggerTimestamp = clock_();

    // Published before the source starts: the first callback may arrive
    // before source.start() returns
    running_.store(true);
    state_.store(SessionState::Running, std::memory_order_release);

    bool sourceStarted = false;
    try {
        sourceStarted = source.start([this](const AudioBufferView& buffer) {
            processBuffer(buffer);
        });
    } catch (const std::exception& e) {
        logger()->error("error starting audio engine: {}", e.what());
    }

    if (!sourceStarted) {
        logger()->error("audio source failed to start; session stopped");
        shutdown();
        state_.store(SessionState::Stopped, std::memory_order_release);
        return false;
    }

    logger()->info("analysis session running: {} frames/buffer, gate {:.2f} RMS, "
                   "debounce {} ms, haptics {}",
                   config_.frameCount, config_.loudnessGate,
                   std::chrono::duration_cast<Milliseconds>(config_.debounceInterval).count(),
                   toString(emissionMode_));
    return true;
}

void AnalysisSession::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);

    const SessionState current = state_.load(std::memory_order_acquire);
    if (current == SessionState::Stopped) return;

    if (current == SessionState::Running) {
        shutdown();

        const SessionStatistics stats = statistics();
        logger()->info("analysis session stopped: {} buffers ({} degraded), {} triggers, "
                       "{} events, {} fallback pulses, {} dropped, {} emitter errors",
                       stats.buffersAnalyzed, stats.degradedAnalyses, stats.triggers,
                       stats.dispatch.eventsEmitted, stats.dispatch.fallbackPulses,
                       stats.dispatch.requestsDropped, stats.dispatch.emitterErrors);
    }

    state_.store(SessionState::Stopped, std::memory_order_release);
}

void AnalysisSession::shutdown() {
    running_.store(false);

    if (source_ != nullptr) {
        try {
            source_->stop();
        } catch (const std::exception& e) {
            logger()->error("error stopping audio engine: {}", e.what());
        }
    }

    // A callback that saw running_ == true may still be finishing; it must
    // complete its post before the dispatcher is torn down
    waitForCallbacksToDrain();
    dispatcher_.stop();

    if (emitterStarted_) {
        try {
            emitter_->stop();
        } catch (const std::exception& e) {
            logger()->error("error stopping haptic engine: {}", e.what());
        }
        emitterStarted_ = false;
    }
}

void AnalysisSession::selectEmissionMode(HapticEmitter& emitter) {
    emissionMode_ = EmissionMode::None;

    try {
        capabilities_ = emitter.capabilities();
    } catch (const std::exception& e) {
        logger()->error("could not query haptic capabilities: {}", e.what());
        capabilities_ = HapticCapabilities{};
    }

    if (capabilities_.supportsFineGrainedHaptics) {
        try {
            emitterStarted_ = emitter.start();
        } catch (const std::exception& e) {
            logger()->error("error instantiating haptic engine: {}", e.what());
            emitterStarted_ = false;
        }

        if (emitterStarted_) {
            emissionMode_ = EmissionMode::Parametric;
        } else {
            logger()->error("haptic engine failed to start; continuing without haptic feedback");
        }
    } else if (capabilities_.hasFallbackPulse) {
        emissionMode_ = EmissionMode::Fallback;
    } else {
        logger()->info("no haptic hardware available; analysis only");
    }
}

void AnalysisSession::waitForCallbacksToDrain() const noexcept {
    while (callbacksInFlight_.load() > 0) {
        std::this_thread::yield();
    }
}

// =============================================================================
// Audio Thread
// =============================================================================

void AnalysisSession::processBuffer(const AudioBufferView& buffer) noexcept {
    // Register before checking running_: pairs with shutdown(), which clears
    // running_ before waiting for the in-flight count to reach zero
    callbacksInFlight_.fetch_add(1);

    if (running_.load()) {
        buffersAnalyzed_.fetch_add(1, std::memory_order_relaxed);

        const float rms = LoudnessEstimator::rms(buffer);
        const float frequency = analyzer_.analyze(buffer);

        const SpectralAnalyzer::Status status = analyzer_.lastStatus();
        if (status != SpectralAnalyzer::Status::Ok) {
            degradedAnalyses_.fetch_add(1, std::memory_order_relaxed);
            raiseDiagnostic(status);
        }

        if (policy_.decide(rms, clock_(), triggerState_)) {
            triggers_.fetch_add(1, std::memory_order_relaxed);

            switch (emissionMode_) {
                case EmissionMode::Parametric:
                    dispatcher_.post({HapticRequest::Kind::Event, mapper_.map(rms, frequency)});
                    break;
                case EmissionMode::Fallback:
                    dispatcher_.post({HapticRequest::Kind::FallbackPulse, HapticEvent{}});
                    break;
                case EmissionMode::None:
                    break;
            }
        }
    }

    callbacksInFlight_.fetch_sub(1);
}

void AnalysisSession::raiseDiagnostic(SpectralAnalyzer::Status status) noexcept {
    switch (status) {
        case SpectralAnalyzer::Status::Ok:
            break;
        case SpectralAnalyzer::Status::InvalidBuffer:
            dispatcher_.raise(Diagnostic::InvalidBuffer);
            break;
        case SpectralAnalyzer::Status::NotPowerOfTwo:
            dispatcher_.raise(Diagnostic::NotPowerOfTwo);
            break;
        case SpectralAnalyzer::Status::FrameCountMismatch:
            dispatcher_.raise(Diagnostic::FrameCountMismatch);
            break;
        case SpectralAnalyzer::Status::NotPrepared:
            dispatcher_.raise(Diagnostic::AnalyzerUnavailable);
            break;
    }
}

// =============================================================================
// Query
// =============================================================================

HapticCapabilities AnalysisSession::capabilities() const {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return capabilities_;
}

EmissionMode AnalysisSession::emissionMode() const {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return emissionMode_;
}

SessionStatistics AnalysisSession::statistics() const noexcept {
    SessionStatistics stats;
    stats.buffersAnalyzed = buffersAnalyzed_.load(std::memory_order_relaxed);
    stats.degradedAnalyses = degradedAnalyses_.load(std::memory_order_relaxed);
    stats.triggers = triggers_.load(std::memory_order_relaxed);
    stats.dispatch = dispatcher_.statistics();
    return stats;
}

} // namespace DSP
} // namespace Tactile
