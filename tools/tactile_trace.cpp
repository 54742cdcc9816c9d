// ==============================================================================
// Tactile Trace
// ==============================================================================
// Runs a scripted test signal through an AnalysisSession and prints every
// haptic the session would play. Useful for checking tuning changes without
// a device.
//
// Usage:
//   tactile_trace [--fallback] [--no-haptics] [--realtime] [--verbose]
//                 [--rate <Hz>] [--frames <n>] [--gate <rms>]
// ==============================================================================

#include "tactile/dsp/core/logging.h"
#include "tactile/dsp/core/math_constants.h"
#include "tactile/dsp/systems/analysis_session.h"
#include "tactile/dsp/systems/offline_audio_source.h"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>
#include <string>
#include <vector>

using namespace Tactile::DSP;

// ==============================================================================
// Console Emitter
// ==============================================================================
// Prints emissions instead of driving an actuator.

class ConsoleHapticEmitter : public HapticEmitter {
public:
    explicit ConsoleHapticEmitter(HapticCapabilities capabilities)
        : capabilities_(capabilities) {}

    HapticCapabilities capabilities() const override { return capabilities_; }

    bool start() override {
        logger()->debug("console haptic engine started");
        return true;
    }

    void stop() override {
        logger()->debug("console haptic engine stopped");
    }

    void emit(const HapticEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "  #" << std::setw(3) << ++count_ << "  event     intensity " << std::setprecision(2)
                  << event.intensity << "  sharpness " << event.sharpness
                  << "  duration " << event.duration << " s" << std::endl;
    }

    void emitFallbackPulse() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "  #" << std::setw(3) << ++count_ << "  fallback  heavy impact" << std::endl;
    }

private:
    HapticCapabilities capabilities_;
    std::mutex mutex_;
    int count_ = 0;
};

// ==============================================================================
// Test Signal
// ==============================================================================

struct Segment {
    const char* label;
    double seconds;
    float frequency;  // 0 for silence
    float rms;
};

// A short phrase covering each sharpness band, a sub-gate passage and silence
const std::vector<Segment> kScript = {
    {"silence",        0.5, 0.0f,    0.0f},
    {"bass hit",       0.4, 45.0f,   0.6f},
    {"quiet pad",      0.6, 330.0f,  0.1f},
    {"mid thump",      0.4, 95.0f,   0.35f},
    {"lead",           0.8, 880.0f,  0.8f},
    {"silence",        0.3, 0.0f,    0.0f},
};

std::vector<float> renderScript(double sampleRate) {
    std::vector<float> signal;
    for (const auto& segment : kScript) {
        const auto frames = static_cast<size_t>(segment.seconds * sampleRate);
        const float amplitude = segment.rms * std::sqrt(2.0f);
        const size_t start = signal.size();
        signal.resize(start + frames, 0.0f);
        if (segment.frequency <= 0.0f) continue;
        for (size_t i = 0; i < frames; ++i) {
            signal[start + i] = amplitude * std::sin(kTwoPi * segment.frequency *
                                                     static_cast<float>(i) /
                                                     static_cast<float>(sampleRate));
        }
    }
    return signal;
}

// ==============================================================================
// Command Line
// ==============================================================================

struct Options {
    HapticCapabilities capabilities{true, true};
    bool realtime = false;
    bool verbose = false;
    double sampleRate = 44100.0;
    size_t frames = SpectralAnalyzer::kDefaultFrameCount;
    float gate = TriggerPolicy::kDefaultLoudnessGate;
};

void printUsage() {
    std::cout << "Usage: tactile_trace [--fallback] [--no-haptics] [--realtime] [--verbose]\n"
              << "                     [--rate <Hz>] [--frames <n>] [--gate <rms>]" << std::endl;
}

bool parseArguments(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (arg == "--fallback") {
            options.capabilities = {false, true};
        } else if (arg == "--no-haptics") {
            options.capabilities = {false, false};
        } else if (arg == "--realtime") {
            options.realtime = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--rate" && hasValue) {
            options.sampleRate = std::atof(argv[++i]);
        } else if (arg == "--frames" && hasValue) {
            options.frames = static_cast<size_t>(std::atol(argv[++i]));
        } else if (arg == "--gate" && hasValue) {
            options.gate = static_cast<float>(std::atof(argv[++i]));
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << std::endl;
            return false;
        }
    }

    if (options.sampleRate <= 0.0 || options.frames == 0) {
        std::cerr << "Sample rate and frame count must be positive" << std::endl;
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    Options options;
    if (!parseArguments(argc, argv, options)) {
        printUsage();
        return 2;
    }

    setLogLevel(options.verbose ? spdlog::level::debug : spdlog::level::warn);

    OfflineAudioSource::Options sourceOptions;
    sourceOptions.framesPerBuffer = options.frames;
    sourceOptions.sampleRate = options.sampleRate;
    sourceOptions.paceInRealTime = options.realtime;
    OfflineAudioSource source(renderScript(options.sampleRate), sourceOptions);

    ConsoleHapticEmitter emitter(options.capabilities);

    AnalysisConfig config;
    config.frameCount = options.frames;
    config.loudnessGate = options.gate;

    // Debounce on stream time so offline runs match real-time playback
    ClockFunction clock = systemClock();
    if (!options.realtime) {
        clock = [&source] {
            return TimePoint(std::chrono::duration_cast<MonotonicClock::duration>(
                source.streamPosition()));
        };
    }

    std::cout << "Script:";
    for (const auto& segment : kScript) {
        std::cout << " " << segment.label << " (" << segment.seconds << " s)";
    }
    std::cout << std::endl << std::endl;

    AnalysisSession session(config, clock);
    if (!session.start(source, emitter)) {
        std::cerr << "Session failed to start" << std::endl;
        return 1;
    }

    source.waitUntilFinished();

    // Let the dispatch thread play what is still queued before stopping
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    while (std::chrono::steady_clock::now() < deadline) {
        const SessionStatistics pending = session.statistics();
        const uint64_t settled = pending.dispatch.eventsEmitted + pending.dispatch.fallbackPulses +
                                 pending.dispatch.requestsDropped + pending.dispatch.emitterErrors;
        if (settled >= pending.triggers || session.emissionMode() == EmissionMode::None) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    session.stop();

    const SessionStatistics stats = session.statistics();
    std::cout << std::endl
              << "Buffers analyzed:   " << stats.buffersAnalyzed << std::endl
              << "Degraded analyses:  " << stats.degradedAnalyses << std::endl
              << "Triggers:           " << stats.triggers << std::endl
              << "Events emitted:     " << stats.dispatch.eventsEmitted << std::endl
              << "Fallback pulses:    " << stats.dispatch.fallbackPulses << std::endl
              << "Dropped/discarded:  " << stats.dispatch.requestsDropped << "/"
              << stats.dispatch.requestsDiscarded << std::endl;

    return stats.dispatch.emitterErrors == 0 ? 0 : 1;
}
