// ==============================================================================
// Haptic Dispatcher Implementation
// ==============================================================================

#include "haptic_dispatcher.h"

#include "tactile/dsp/core/logging.h"

#include <exception>
#include <system_error>

namespace Tactile {
namespace DSP {

namespace {

const char* describe(Diagnostic diagnostic) noexcept {
    switch (diagnostic) {
        case Diagnostic::InvalidBuffer:
            return "received an empty or malformed buffer; analysis returned 0";
        case Diagnostic::NotPowerOfTwo:
            return "buffer frame count is not a power of two; dominant frequency reported as 0 Hz";
        case Diagnostic::FrameCountMismatch:
            return "buffer frame count differs from the prepared analysis length; dominant frequency reported as 0 Hz";
        case Diagnostic::AnalyzerUnavailable:
            return "spectral analyzer is not prepared; dominant frequency reported as 0 Hz";
        case Diagnostic::QueueOverflow:
            return "haptic request queue full; triggers are being dropped";
    }
    return "unknown diagnostic";
}

constexpr Diagnostic kAllDiagnostics[] = {
    Diagnostic::InvalidBuffer,
    Diagnostic::NotPowerOfTwo,
    Diagnostic::FrameCountMismatch,
    Diagnostic::AnalyzerUnavailable,
    Diagnostic::QueueOverflow,
};

} // namespace

HapticDispatcher::~HapticDispatcher() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

void HapticDispatcher::prepare(size_t queueCapacity) {
    queue_.prepare(queueCapacity);
}

bool HapticDispatcher::start(HapticEmitter& emitter) {
    if (worker_.joinable()) {
        logger()->warn("haptic dispatcher already running");
        return false;
    }
    if (queue_.capacity() == 0) {
        logger()->error("haptic dispatcher started without a prepared queue");
        return false;
    }

    // Leftovers from a previous run are stale
    HapticRequest stale;
    while (queue_.pop(stale)) {}

    emitter_ = &emitter;
    stopRequested_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    try {
        worker_ = std::thread([this] { run(); });
    } catch (const std::system_error& e) {
        running_.store(false, std::memory_order_release);
        emitter_ = nullptr;
        logger()->error("could not start haptic dispatch thread: {}", e.what());
        return false;
    }
    return true;
}

void HapticDispatcher::stop() {
    if (!worker_.joinable()) return;

    running_.store(false, std::memory_order_release);
    stopRequested_.store(true, std::memory_order_release);
    wake();
    worker_.join();

    // The worker is gone; this thread is now the only consumer
    HapticRequest request;
    uint64_t discarded = 0;
    while (queue_.pop(request)) {
        ++discarded;
    }
    if (discarded > 0) {
        requestsDiscarded_.fetch_add(discarded, std::memory_order_relaxed);
        logger()->debug("discarded {} pending haptic request(s) on stop", discarded);
    }

    reportDiagnostics();
    emitter_ = nullptr;
}

// =============================================================================
// Audio Thread
// =============================================================================

bool HapticDispatcher::post(const HapticRequest& request) noexcept {
    if (!running_.load(std::memory_order_acquire)) return false;

    if (!queue_.push(request)) {
        requestsDropped_.fetch_add(1, std::memory_order_relaxed);
        raise(Diagnostic::QueueOverflow);
        return false;
    }

    wake();
    return true;
}

void HapticDispatcher::raise(Diagnostic diagnostic) noexcept {
    const auto bit = static_cast<uint32_t>(diagnostic);
    const uint32_t previous = pendingDiagnostics_.fetch_or(bit, std::memory_order_acq_rel);
    if ((previous & bit) == 0) {
        wake();
    }
}

void HapticDispatcher::wake() noexcept {
    wakeSequence_.fetch_add(1, std::memory_order_release);
    wakeSequence_.notify_one();
}

// =============================================================================
// Worker Thread
// =============================================================================

void HapticDispatcher::run() {
    while (true) {
        const uint32_t seen = wakeSequence_.load(std::memory_order_acquire);
        if (stopRequested_.load(std::memory_order_acquire)) break;

        drainRequests();
        reportDiagnostics();

        if (stopRequested_.load(std::memory_order_acquire)) break;
        wakeSequence_.wait(seen, std::memory_order_acquire);
    }
}

void HapticDispatcher::drainRequests() {
    HapticRequest request;
    while (!stopRequested_.load(std::memory_order_acquire) && queue_.pop(request)) {
        deliver(request);
    }
}

void HapticDispatcher::deliver(const HapticRequest& request) {
    try {
        switch (request.kind) {
            case HapticRequest::Kind::Event:
                emitter_->emit(request.event);
                eventsEmitted_.fetch_add(1, std::memory_order_relaxed);
                break;
            case HapticRequest::Kind::FallbackPulse:
                emitter_->emitFallbackPulse();
                fallbackPulses_.fetch_add(1, std::memory_order_relaxed);
                break;
        }
    } catch (const std::exception& e) {
        emitterErrors_.fetch_add(1, std::memory_order_relaxed);
        logger()->error("error playing haptic: {}", e.what());
    }
}

void HapticDispatcher::reportDiagnostics() {
    const uint32_t pending = pendingDiagnostics_.load(std::memory_order_acquire);
    const uint32_t fresh = pending & ~reportedDiagnostics_;
    if (fresh == 0) return;

    for (Diagnostic diagnostic : kAllDiagnostics) {
        if ((fresh & static_cast<uint32_t>(diagnostic)) != 0) {
            logger()->warn("audio analysis: {}", describe(diagnostic));
        }
    }
    reportedDiagnostics_ |= fresh;
}

// =============================================================================
// Query
// =============================================================================

DispatchStatistics HapticDispatcher::statistics() const noexcept {
    DispatchStatistics stats;
    stats.eventsEmitted = eventsEmitted_.load(std::memory_order_relaxed);
    stats.fallbackPulses = fallbackPulses_.load(std::memory_order_relaxed);
    stats.requestsDropped = requestsDropped_.load(std::memory_order_relaxed);
    stats.requestsDiscarded = requestsDiscarded_.load(std::memory_order_relaxed);
    stats.emitterErrors = emitterErrors_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace DSP
} // namespace Tactile
