// ==============================================================================
// Layer 0: Core Utility - Logging
// ==============================================================================
// Shared spdlog logger for the library's control and worker threads.
//
// Never call into the logger from an audio callback: formatting and sinks may
// allocate and block. Real-time code records diagnostics in atomics and lets
// a non-real-time thread report them.
// ==============================================================================

#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace Tactile {
namespace DSP {

/// Name under which the library logger is registered with spdlog
inline constexpr const char* kLoggerName = "tactile";

/// @brief Library logger (created on first use, colour stderr sink)
/// @note Thread-safe; NOT real-time safe
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// @brief Set the library logger's level
void setLogLevel(spdlog::level::level_enum level);

} // namespace DSP
} // namespace Tactile
