// ==============================================================================
// Logging Implementation
// ==============================================================================

#include "logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace Tactile {
namespace DSP {

std::shared_ptr<spdlog::logger> logger() {
    // Function-local static: registered once even with concurrent first calls
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(kLoggerName);
        created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace DSP
} // namespace Tactile
