// ==============================================================================
// Offline Audio Source Implementation
// ==============================================================================

#include "offline_audio_source.h"

#include "tactile/dsp/core/logging.h"

#include <algorithm>
#include <system_error>
#include <utility>

namespace Tactile {
namespace DSP {

OfflineAudioSource::OfflineAudioSource(std::vector<float> samples, const Options& options)
    : samples_(std::move(samples))
    , options_(options) {}

OfflineAudioSource::~OfflineAudioSource() {
    stop();
}

bool OfflineAudioSource::start(BufferCallback callback) {
    if (thread_.joinable()) {
        logger()->warn("offline audio source already started");
        return false;
    }
    if (!callback || options_.framesPerBuffer == 0 || options_.sampleRate <= 0.0) {
        logger()->error("offline audio source needs a callback, a positive buffer size "
                        "and a positive sample rate");
        return false;
    }

    callback_ = std::move(callback);
    stopRequested_.store(false, std::memory_order_release);
    framesBeforeCurrent_.store(0, std::memory_order_release);
    buffersDelivered_.store(0, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(finishedMutex_);
        finished_ = false;
    }

    running_.store(true, std::memory_order_release);
    try {
        thread_ = std::thread([this] { run(); });
    } catch (const std::system_error& e) {
        running_.store(false, std::memory_order_release);
        markFinished();
        logger()->error("could not start offline audio thread: {}", e.what());
        return false;
    }
    return true;
}

void OfflineAudioSource::stop() {
    stopRequested_.store(true, std::memory_order_release);

    if (deliveryThread_.load(std::memory_order_acquire) == std::this_thread::get_id()) {
        // Called from the callback: run() exits after this buffer
        return;
    }
    if (!thread_.joinable()) return;
    thread_.join();
}

bool OfflineAudioSource::isRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
}

void OfflineAudioSource::waitUntilFinished() {
    std::unique_lock<std::mutex> lock(finishedMutex_);
    finishedCondition_.wait(lock, [this] { return finished_; });
}

std::chrono::nanoseconds OfflineAudioSource::streamPosition() const noexcept {
    const auto frames = static_cast<double>(framesBeforeCurrent_.load(std::memory_order_acquire));
    return std::chrono::nanoseconds(
        static_cast<int64_t>(frames * 1.0e9 / options_.sampleRate));
}

void OfflineAudioSource::run() {
    deliveryThread_.store(std::this_thread::get_id(), std::memory_order_release);

    const size_t blockSize = options_.framesPerBuffer;
    const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(static_cast<double>(blockSize) / options_.sampleRate));
    auto nextDeadline = std::chrono::steady_clock::now();

    for (size_t offset = 0; offset < samples_.size(); offset += blockSize) {
        if (stopRequested_.load(std::memory_order_acquire)) break;

        const size_t frames = std::min(blockSize, samples_.size() - offset);
        framesBeforeCurrent_.store(offset, std::memory_order_release);

        callback_(AudioBufferView{samples_.data() + offset, frames, options_.sampleRate});
        buffersDelivered_.fetch_add(1, std::memory_order_acq_rel);

        if (options_.paceInRealTime) {
            nextDeadline += period;
            std::this_thread::sleep_until(nextDeadline);
        }
    }

    running_.store(false, std::memory_order_release);
    deliveryThread_.store(std::thread::id{}, std::memory_order_release);
    markFinished();
}

void OfflineAudioSource::markFinished() {
    {
        std::lock_guard<std::mutex> lock(finishedMutex_);
        finished_ = true;
    }
    finishedCondition_.notify_all();
}

} // namespace DSP
} // namespace Tactile
