// ==============================================================================
// Layer 3: System Tests - Offline Audio Source
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <tactile/dsp/systems/analysis_session.h>
#include <tactile/dsp/systems/offline_audio_source.h>

#include "test_helpers/recording_haptic_emitter.h"
#include "test_helpers/test_signals.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace Tactile::DSP;
using Tactile::Testing::RecordingHapticEmitter;
using namespace std::chrono_literals;

namespace {

OfflineAudioSource::Options options(size_t framesPerBuffer, double sampleRate = 44100.0) {
    OfflineAudioSource::Options result;
    result.framesPerBuffer = framesPerBuffer;
    result.sampleRate = sampleRate;
    return result;
}

} // namespace

TEST_CASE("OfflineAudioSource slices the signal into buffers", "[offline][source]") {
    std::vector<float> signal(2500);
    for (size_t i = 0; i < signal.size(); ++i) {
        signal[i] = static_cast<float>(i);
    }

    OfflineAudioSource source(signal, options(1024));

    std::mutex mutex;
    std::vector<size_t> sizes;
    std::vector<float> firstSamples;
    std::vector<double> rates;

    REQUIRE(source.start([&](const AudioBufferView& buffer) {
        std::lock_guard<std::mutex> lock(mutex);
        sizes.push_back(buffer.numFrames);
        firstSamples.push_back(buffer.samples[0]);
        rates.push_back(buffer.sampleRate);
    }));
    source.waitUntilFinished();
    source.stop();

    REQUIRE(sizes == std::vector<size_t>{1024, 1024, 452});
    REQUIRE(firstSamples == std::vector<float>{0.0f, 1024.0f, 2048.0f});
    REQUIRE(rates == std::vector<double>{44100.0, 44100.0, 44100.0});
    REQUIRE(source.buffersDelivered() == 3);
    REQUIRE_FALSE(source.isRunning());
}

TEST_CASE("OfflineAudioSource stream position advances per buffer", "[offline][source]") {
    std::vector<float> signal(4 * 480, 0.0f);
    OfflineAudioSource source(signal, options(480, 48000.0));

    std::mutex mutex;
    std::vector<std::chrono::nanoseconds> positions;

    REQUIRE(source.start([&](const AudioBufferView&) {
        std::lock_guard<std::mutex> lock(mutex);
        positions.push_back(source.streamPosition());
    }));
    source.waitUntilFinished();
    source.stop();

    // 480 frames at 48 kHz = 10 ms
    REQUIRE(positions == std::vector<std::chrono::nanoseconds>{0ms, 10ms, 20ms, 30ms});
}

TEST_CASE("OfflineAudioSource rejects unusable starts", "[offline][source][edge]") {
    std::vector<float> signal(1024, 0.0f);

    SECTION("empty callback") {
        OfflineAudioSource source(signal, options(256));
        REQUIRE_FALSE(source.start(BufferCallback{}));
    }

    SECTION("zero buffer size") {
        OfflineAudioSource source(signal, options(0));
        REQUIRE_FALSE(source.start([](const AudioBufferView&) {}));
    }

    SECTION("non-positive sample rate") {
        OfflineAudioSource source(signal, options(256, 0.0));
        REQUIRE_FALSE(source.start([](const AudioBufferView&) {}));
    }

    SECTION("second start") {
        OfflineAudioSource source(signal, options(256));
        REQUIRE(source.start([](const AudioBufferView&) {}));
        REQUIRE_FALSE(source.start([](const AudioBufferView&) {}));
        source.stop();
    }
}

TEST_CASE("OfflineAudioSource waitUntilFinished before start returns", "[offline][source][edge]") {
    OfflineAudioSource source(std::vector<float>(16, 0.0f), options(16));
    source.waitUntilFinished();
    REQUIRE(source.buffersDelivered() == 0);
}

TEST_CASE("OfflineAudioSource stop halts delivery", "[offline][source]") {
    std::vector<float> signal(1024 * 1000, 0.0f);

    SECTION("from the control thread") {
        OfflineAudioSource::Options paced = options(1024);
        paced.paceInRealTime = true;
        OfflineAudioSource source(signal, paced);

        std::atomic<int> calls{0};
        REQUIRE(source.start([&](const AudioBufferView&) { calls.fetch_add(1); }));
        std::this_thread::sleep_for(60ms);
        source.stop();

        const int atStop = calls.load();
        REQUIRE_FALSE(source.isRunning());
        REQUIRE(atStop < 1000);
        std::this_thread::sleep_for(30ms);
        REQUIRE(calls.load() == atStop);
    }

    SECTION("from inside the callback") {
        OfflineAudioSource source(signal, options(1024));
        std::atomic<int> calls{0};
        REQUIRE(source.start([&](const AudioBufferView&) {
            if (calls.fetch_add(1) == 2) source.stop();
        }));
        source.waitUntilFinished();
        source.stop();

        REQUIRE(calls.load() == 3);
    }
}

TEST_CASE("OfflineAudioSource drives a session on stream time", "[offline][session]") {
    constexpr float kRate = 44100.0f;
    constexpr size_t kFrames = 1024;

    // 10 quiet buffers, then 10 loud buffers (~23 ms each)
    const auto signal = TestHelpers::makeStream(
        {{10 * kFrames, 440.0f, 0.05f},
         {10 * kFrames, 440.0f, TestHelpers::sineAmplitudeForRms(0.5f)}},
        kRate);

    OfflineAudioSource source(signal, options(kFrames, kRate));
    RecordingHapticEmitter emitter;
    AnalysisSession session(AnalysisConfig{}, [&source] {
        return TimePoint(std::chrono::duration_cast<MonotonicClock::duration>(
            source.streamPosition()));
    });

    REQUIRE(session.start(source, emitter));
    source.waitUntilFinished();
    // Loud buffers 0 and 5 of the loud run are more than 100 ms apart
    REQUIRE(emitter.waitForEmissions(2));
    session.stop();

    const auto stats = session.statistics();
    REQUIRE(stats.buffersAnalyzed == 20);
    REQUIRE(stats.triggers == 2);
    REQUIRE(emitter.eventCount() == 2);
}
