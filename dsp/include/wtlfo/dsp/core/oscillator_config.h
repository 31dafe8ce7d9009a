// ==============================================================================
// Layer 0: Core Utility - Oscillator Configuration
// ==============================================================================
// Value type describing one LFO voice: shape, timebase, rate, trigger
// behavior, depth, fade-in and phase offset. Always copied, never shared, so
// editing a live configuration can never reach into a stored preset.
//
// Constitution Compliance:
// - Principle III: Modern C++ (value semantics, defaulted comparison)
// - Principle IX: Layer 0 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include <wtlfo/dsp/core/random.h>
#include <wtlfo/dsp/core/transport_sync.h>
#include <wtlfo/dsp/core/waveform.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <string_view>

namespace Wtlfo {
namespace DSP {

// =============================================================================
// Enumerations
// =============================================================================

/// @brief What drives the phase forward.
enum class Timebase : uint8_t {
    Free = 0,    ///< Wall-clock time (elapsed seconds)
    ClockSync    ///< Received MIDI clock ticks
};

/// @brief How the free-timebase rate is specified.
enum class SpeedMode : uint8_t {
    Hertz = 0,       ///< speedHz cycles per second
    TempoRelative    ///< tempo / 60 x multiplier / beatsPerCycle
};

/// @brief Reaction to transport and explicit retrigger events.
enum class TriggerMode : uint8_t {
    Free = 0,   ///< Ignores transport entirely
    Trigger,    ///< Restarts on start and explicit retrigger (key / clock sync)
    Hold,       ///< Phase keeps running; output latches at each trigger
    OneShot,    ///< Plays exactly one cycle per trigger, then holds
    HalfShot    ///< Plays half a cycle per trigger, then holds
};

inline constexpr int kTriggerModeCount = 5;

inline constexpr std::array<std::string_view, kTriggerModeCount> kTriggerModeLabels = {
    "FRE", "TRG", "HLD", "ONE", "HLF"
};

[[nodiscard]] constexpr std::string_view triggerModeLabel(TriggerMode mode) noexcept {
    const auto index = static_cast<size_t>(mode);
    return index < kTriggerModeLabels.size() ? kTriggerModeLabels[index] : std::string_view{};
}

/// True for modes that stop after a fraction of a cycle.
[[nodiscard]] constexpr bool isShotMode(TriggerMode mode) noexcept {
    return mode == TriggerMode::OneShot || mode == TriggerMode::HalfShot;
}

/// Cycle length played per trigger by shot modes (1 for looping modes).
[[nodiscard]] constexpr double shotLength(TriggerMode mode) noexcept {
    return mode == TriggerMode::HalfShot ? 0.5 : 1.0;
}

// =============================================================================
// Parameter ranges
// =============================================================================

inline constexpr float kMinSpeedHz = 0.01f;
inline constexpr float kMaxSpeedHz = 50.0f;
inline constexpr float kDefaultSpeedHz = 1.0f;
inline constexpr float kMinDepthPercent = 0.0f;
inline constexpr float kMaxDepthPercent = 100.0f;
inline constexpr float kMaxFadeIn = 64.0f;  ///< Seconds (free) or cycles (synced)

// =============================================================================
// OscillatorConfig
// =============================================================================

/// @brief Complete configuration of one LFO voice.
///
/// fadeIn is measured in seconds for the free timebase and in cycles for the
/// clock-synced timebase.
struct OscillatorConfig {
    Waveform waveform = Waveform::Sine;
    Timebase timebase = Timebase::Free;
    SpeedMode speedMode = SpeedMode::Hertz;
    float speedHz = kDefaultSpeedHz;
    Ratio multiplier{1, 1};
    Ratio beatsPerCycle{4, 1};
    TriggerMode triggerMode = TriggerMode::Free;
    float depth = kMaxDepthPercent;  ///< 0..100 %
    bool inverted = false;
    float fadeIn = 0.0f;
    double phaseOffset = 0.0;        ///< [0, 1)
    uint32_t randomSeed = SteppedRandom::kDefaultLfoSeed;

    bool operator==(const OscillatorConfig&) const = default;
};

/// @brief Clamp every field of a configuration into its legal range.
///
/// Non-finite floats fall back to their defaults. Used on anything that
/// crosses a trust boundary (stream loads, UI edits) before publication.
[[nodiscard]] inline OscillatorConfig sanitize(OscillatorConfig config) noexcept {
    const OscillatorConfig defaults{};

    if (static_cast<int>(config.waveform) >= kWaveformCount) {
        config.waveform = defaults.waveform;
    }
    if (static_cast<int>(config.timebase) > static_cast<int>(Timebase::ClockSync)) {
        config.timebase = defaults.timebase;
    }
    if (static_cast<int>(config.speedMode) > static_cast<int>(SpeedMode::TempoRelative)) {
        config.speedMode = defaults.speedMode;
    }
    if (static_cast<int>(config.triggerMode) >= kTriggerModeCount) {
        config.triggerMode = defaults.triggerMode;
    }

    config.speedHz = std::isfinite(config.speedHz)
        ? std::clamp(config.speedHz, kMinSpeedHz, kMaxSpeedHz)
        : defaults.speedHz;
    config.depth = std::isfinite(config.depth)
        ? std::clamp(config.depth, kMinDepthPercent, kMaxDepthPercent)
        : defaults.depth;
    config.fadeIn = std::isfinite(config.fadeIn)
        ? std::clamp(config.fadeIn, 0.0f, kMaxFadeIn)
        : defaults.fadeIn;
    config.phaseOffset = std::isfinite(config.phaseOffset)
        ? wrapPhase(config.phaseOffset)
        : defaults.phaseOffset;

    config.multiplier = config.multiplier.bounded();
    config.beatsPerCycle = config.beatsPerCycle.bounded();
    return config;
}

} // namespace DSP
} // namespace Wtlfo
