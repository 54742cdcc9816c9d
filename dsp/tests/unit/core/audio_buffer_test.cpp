// ==============================================================================
// Layer 0: Core Utility Tests - AudioBufferView
// ==============================================================================

#include <tactile/dsp/core/audio_buffer.h>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <array>

using namespace Tactile::DSP;
using Catch::Approx;

TEST_CASE("AudioBufferView validity", "[core][buffer]") {
    std::array<float, 8> samples{};

    SECTION("data, frames and rate make a valid view") {
        REQUIRE(AudioBufferView{samples.data(), 8, 48000.0}.isValid());
    }

    SECTION("default view is invalid") {
        REQUIRE_FALSE(AudioBufferView{}.isValid());
    }

    SECTION("null samples are invalid") {
        REQUIRE_FALSE(AudioBufferView{nullptr, 8, 48000.0}.isValid());
    }

    SECTION("zero frames are invalid") {
        REQUIRE_FALSE(AudioBufferView{samples.data(), 0, 48000.0}.isValid());
    }

    SECTION("non-positive sample rate is invalid") {
        REQUIRE_FALSE(AudioBufferView{samples.data(), 8, 0.0}.isValid());
        REQUIRE_FALSE(AudioBufferView{samples.data(), 8, -44100.0}.isValid());
    }
}

TEST_CASE("AudioBufferView power-of-two and duration", "[core][buffer]") {
    std::array<float, 1024> samples{};

    REQUIRE(AudioBufferView{samples.data(), 1024, 44100.0}.isPowerOfTwo());
    REQUIRE(AudioBufferView{samples.data(), 1, 44100.0}.isPowerOfTwo());
    REQUIRE_FALSE(AudioBufferView{samples.data(), 1000, 44100.0}.isPowerOfTwo());
    REQUIRE_FALSE(AudioBufferView{samples.data(), 0, 44100.0}.isPowerOfTwo());

    REQUIRE(AudioBufferView{samples.data(), 1024, 48000.0}.durationSeconds() ==
            Approx(1024.0 / 48000.0));
    REQUIRE(AudioBufferView{samples.data(), 1024, 0.0}.durationSeconds() == 0.0);
}
