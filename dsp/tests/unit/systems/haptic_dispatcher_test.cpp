// ==============================================================================
// Layer 3: System Tests - Haptic Dispatcher
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <tactile/dsp/systems/haptic_dispatcher.h>

#include "test_helpers/log_capture.h"
#include "test_helpers/recording_haptic_emitter.h"

#include <chrono>
#include <functional>
#include <thread>

using namespace Tactile::DSP;
using Tactile::Testing::LogCapture;
using Tactile::Testing::RecordingHapticEmitter;
using namespace std::chrono_literals;

namespace {

HapticRequest eventRequest(float intensity) {
    HapticRequest request;
    request.kind = HapticRequest::Kind::Event;
    request.event.intensity = intensity;
    request.event.sharpness = 1.0f;
    return request;
}

bool waitUntil(const std::function<bool()>& predicate,
               std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

} // namespace

TEST_CASE("HapticDispatcher lifecycle", "[dispatcher][lifecycle]") {
    HapticDispatcher dispatcher;
    RecordingHapticEmitter emitter;

    SECTION("start requires a prepared queue") {
        REQUIRE_FALSE(dispatcher.start(emitter));
        REQUIRE_FALSE(dispatcher.isRunning());
    }

    SECTION("start and stop") {
        dispatcher.prepare(16);
        REQUIRE(dispatcher.queueCapacity() == 16);
        REQUIRE(dispatcher.start(emitter));
        REQUIRE(dispatcher.isRunning());

        dispatcher.stop();
        REQUIRE_FALSE(dispatcher.isRunning());
    }

    SECTION("second start while running fails") {
        dispatcher.prepare(4);
        REQUIRE(dispatcher.start(emitter));
        REQUIRE_FALSE(dispatcher.start(emitter));
        dispatcher.stop();
    }

    SECTION("stop without start is a no-op") {
        dispatcher.stop();
        REQUIRE_FALSE(dispatcher.isRunning());
    }
}

TEST_CASE("HapticDispatcher delivers posted requests off the calling thread", "[dispatcher]") {
    HapticDispatcher dispatcher;
    RecordingHapticEmitter emitter;
    dispatcher.prepare(16);
    REQUIRE(dispatcher.start(emitter));

    REQUIRE(dispatcher.post(eventRequest(0.25f)));
    REQUIRE(dispatcher.post(eventRequest(0.75f)));
    REQUIRE(dispatcher.post({HapticRequest::Kind::FallbackPulse, HapticEvent{}}));

    REQUIRE(emitter.waitForEmissions(3));
    dispatcher.stop();

    const auto events = emitter.events();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].intensity == 0.25f);
    REQUIRE(events[1].intensity == 0.75f);
    REQUIRE(emitter.fallbackPulseCount() == 1);

    const auto stats = dispatcher.statistics();
    REQUIRE(stats.eventsEmitted == 2);
    REQUIRE(stats.fallbackPulses == 1);
    REQUIRE(stats.requestsDropped == 0);
    REQUIRE(stats.emitterErrors == 0);
}

TEST_CASE("HapticDispatcher rejects posts when not running", "[dispatcher][edge]") {
    HapticDispatcher dispatcher;
    RecordingHapticEmitter emitter;
    dispatcher.prepare(16);

    REQUIRE_FALSE(dispatcher.post(eventRequest(0.5f)));

    REQUIRE(dispatcher.start(emitter));
    dispatcher.stop();

    REQUIRE_FALSE(dispatcher.post(eventRequest(0.5f)));
    std::this_thread::sleep_for(20ms);
    REQUIRE(emitter.eventCount() == 0);
}

TEST_CASE("HapticDispatcher drops requests when the queue is full", "[dispatcher][overflow]") {
    constexpr int kPosted = 10;

    HapticDispatcher dispatcher;
    RecordingHapticEmitter emitter;
    emitter.emitDelay_ = 200ms;
    dispatcher.prepare(2);
    REQUIRE(dispatcher.start(emitter));

    int accepted = 0;
    for (int i = 0; i < kPosted; ++i) {
        if (dispatcher.post(eventRequest(0.5f))) ++accepted;
    }
    dispatcher.stop();

    const auto stats = dispatcher.statistics();
    // Two queued plus at most one already taken by the worker
    REQUIRE(accepted <= 3);
    REQUIRE(stats.requestsDropped == static_cast<uint64_t>(kPosted - accepted));
    // Every accepted request is either delivered or discarded at stop
    REQUIRE(stats.eventsEmitted + stats.requestsDiscarded == static_cast<uint64_t>(accepted));
}

TEST_CASE("HapticDispatcher survives a throwing emitter", "[dispatcher][errors]") {
    HapticDispatcher dispatcher;
    RecordingHapticEmitter emitter;
    emitter.throwOnEmit_ = true;
    dispatcher.prepare(16);
    REQUIRE(dispatcher.start(emitter));

    REQUIRE(dispatcher.post(eventRequest(0.5f)));
    REQUIRE(waitUntil([&] { return dispatcher.statistics().emitterErrors == 1; }));

    REQUIRE(dispatcher.post(eventRequest(0.5f)));
    REQUIRE(waitUntil([&] { return dispatcher.statistics().emitterErrors == 2; }));

    REQUIRE(dispatcher.isRunning());
    dispatcher.stop();

    REQUIRE(dispatcher.statistics().eventsEmitted == 0);
}

TEST_CASE("HapticDispatcher makes no emitter call after stop returns", "[dispatcher][threading]") {
    HapticDispatcher dispatcher;
    RecordingHapticEmitter emitter;
    emitter.emitDelay_ = 5ms;
    dispatcher.prepare(64);
    REQUIRE(dispatcher.start(emitter));

    for (int i = 0; i < 32; ++i) {
        (void)dispatcher.post(eventRequest(0.5f));
    }
    std::this_thread::sleep_for(12ms);
    dispatcher.stop();

    const size_t atStop = emitter.eventCount();
    std::this_thread::sleep_for(50ms);
    REQUIRE(emitter.eventCount() == atStop);

    const auto stats = dispatcher.statistics();
    REQUIRE(stats.eventsEmitted + stats.requestsDiscarded == 32);
}

TEST_CASE("HapticDispatcher logs each diagnostic once", "[dispatcher][diagnostics]") {
    LogCapture capture;

    HapticDispatcher dispatcher;
    RecordingHapticEmitter emitter;
    dispatcher.prepare(4);
    REQUIRE(dispatcher.start(emitter));

    for (int i = 0; i < 20; ++i) {
        dispatcher.raise(Diagnostic::NotPowerOfTwo);
    }
    dispatcher.raise(Diagnostic::InvalidBuffer);
    dispatcher.stop();

    REQUIRE(capture.count("not a power of two") == 1);
    REQUIRE(capture.count("empty or malformed buffer") == 1);
    REQUIRE(capture.count("queue full") == 0);
}
