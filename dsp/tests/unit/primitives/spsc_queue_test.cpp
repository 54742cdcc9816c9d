// ==============================================================================
// Layer 1: DSP Primitive Tests - SPSC Queue
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <tactile/dsp/primitives/spsc_queue.h>

#include <cstdint>
#include <thread>
#include <vector>

using namespace Tactile::DSP;

TEST_CASE("SpscQueue capacity rounds up to a power of two", "[spsc][prepare]") {
    SpscQueue<int> queue;
    REQUIRE(queue.capacity() == 0);

    queue.prepare(5);
    REQUIRE(queue.capacity() == 8);

    queue.prepare(16);
    REQUIRE(queue.capacity() == 16);

    queue.prepare(0);
    REQUIRE(queue.capacity() == 1);
}

TEST_CASE("SpscQueue rejects pushes before prepare", "[spsc][edge]") {
    SpscQueue<int> queue;
    int out = 0;

    REQUIRE_FALSE(queue.push(1));
    REQUIRE_FALSE(queue.pop(out));
    REQUIRE(queue.empty());
}

TEST_CASE("SpscQueue is FIFO", "[spsc]") {
    SpscQueue<int> queue;
    queue.prepare(4);

    REQUIRE(queue.push(10));
    REQUIRE(queue.push(20));
    REQUIRE(queue.push(30));
    REQUIRE(queue.size() == 3);

    int out = 0;
    REQUIRE(queue.pop(out));
    REQUIRE(out == 10);
    REQUIRE(queue.pop(out));
    REQUIRE(out == 20);
    REQUIRE(queue.pop(out));
    REQUIRE(out == 30);
    REQUIRE_FALSE(queue.pop(out));
    REQUIRE(queue.empty());
}

TEST_CASE("SpscQueue rejects rather than overwrites when full", "[spsc][overflow]") {
    SpscQueue<int> queue;
    queue.prepare(2);

    REQUIRE(queue.push(1));
    REQUIRE(queue.push(2));
    REQUIRE_FALSE(queue.push(3));

    int out = 0;
    REQUIRE(queue.pop(out));
    REQUIRE(out == 1);

    // Slot freed: wraps around
    REQUIRE(queue.push(4));
    REQUIRE(queue.pop(out));
    REQUIRE(out == 2);
    REQUIRE(queue.pop(out));
    REQUIRE(out == 4);
}

TEST_CASE("SpscQueue prepare clears contents", "[spsc][prepare]") {
    SpscQueue<int> queue;
    queue.prepare(4);
    REQUIRE(queue.push(1));

    queue.prepare(4);
    REQUIRE(queue.empty());
}

TEST_CASE("SpscQueue delivers every value across threads in order", "[spsc][threading]") {
    constexpr uint32_t kCount = 100000;

    SpscQueue<uint32_t> queue;
    queue.prepare(64);

    std::thread producer([&] {
        for (uint32_t i = 0; i < kCount; ++i) {
            while (!queue.push(i)) {
                std::this_thread::yield();
            }
        }
    });

    std::vector<uint32_t> received;
    received.reserve(kCount);
    uint32_t value = 0;
    while (received.size() < kCount) {
        if (queue.pop(value)) {
            received.push_back(value);
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();

    bool inOrder = true;
    for (uint32_t i = 0; i < kCount; ++i) {
        if (received[i] != i) {
            inOrder = false;
            break;
        }
    }
    REQUIRE(inOrder);
    REQUIRE(queue.empty());
}
