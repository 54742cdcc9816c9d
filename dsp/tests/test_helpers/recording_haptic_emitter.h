#pragma once

// =============================================================================
// Recording HapticEmitter for Session Testing
// =============================================================================
// Captures every emission for verification and lets tests script capability
// flags, start failures, slow drivers and throwing drivers.
// =============================================================================

#include <tactile/dsp/systems/haptic_emitter.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace Tactile {
namespace Testing {

class RecordingHapticEmitter : public DSP::HapticEmitter {
public:
    // Scripted behaviour (set before the session starts)
    DSP::HapticCapabilities capabilities_{true, true};
    bool startSucceeds_ = true;
    bool throwOnEmit_ = false;
    std::chrono::milliseconds emitDelay_{0};

    // Call tracking
    mutable std::atomic<int> capabilityQueries_{0};
    std::atomic<int> startCalls_{0};
    std::atomic<int> stopCalls_{0};

    DSP::HapticCapabilities capabilities() const override {
        capabilityQueries_.fetch_add(1);
        return capabilities_;
    }

    bool start() override {
        startCalls_.fetch_add(1);
        return startSucceeds_;
    }

    void stop() override {
        stopCalls_.fetch_add(1);
    }

    void emit(const DSP::HapticEvent& event) override {
        if (emitDelay_.count() > 0) {
            std::this_thread::sleep_for(emitDelay_);
        }
        if (throwOnEmit_) {
            throw std::runtime_error("actuator rejected pattern");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
        condition_.notify_all();
    }

    void emitFallbackPulse() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++fallbackPulses_;
        condition_.notify_all();
    }

    // Queries (any thread)

    std::vector<DSP::HapticEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t eventCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    size_t fallbackPulseCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fallbackPulses_;
    }

    /// Wait until at least `count` emissions (events + pulses) arrived
    bool waitForEmissions(size_t count,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return condition_.wait_for(lock, timeout, [&] {
            return events_.size() + fallbackPulses_ >= count;
        });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::vector<DSP::HapticEvent> events_;
    size_t fallbackPulses_ = 0;
};

} // namespace Testing
} // namespace Tactile
