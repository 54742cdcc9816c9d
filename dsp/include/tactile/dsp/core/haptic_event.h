// ==============================================================================
// Layer 0: Core Utility - Haptic Event Types
// ==============================================================================
// Value types exchanged between the analysis pipeline and a haptic emitter.
// ==============================================================================

#pragma once

namespace Tactile {
namespace DSP {

/// @brief A single continuous haptic pulse
///
/// Constructed by HapticParameterMapper, consumed once by a HapticEmitter.
struct HapticEvent {
    float intensity = 0.0f;      ///< Perceived strength [0, 1]
    float sharpness = 0.0f;      ///< Perceived texture, dull to crisp [0, 1]
    float duration = 0.5f;       ///< Seconds, > 0
    float relativeStart = 0.0f;  ///< Seconds from dispatch, >= 0
};

/// @brief What the haptic hardware behind an emitter can do
///
/// Queried once when a session starts and held immutable after.
struct HapticCapabilities {
    /// Parametric (intensity/sharpness/duration) continuous events are supported
    bool supportsFineGrainedHaptics = false;

    /// A coarse, non-parametric platform pulse is available as fallback
    bool hasFallbackPulse = false;
};

} // namespace DSP
} // namespace Tactile
