// ==============================================================================
// Layer 0: Core Utility - LFO Waveform Generator
// ==============================================================================
// Pure mapping from (shape, phase) to a bipolar sample in [-1, 1].
//
// The generator holds no state. The two random shapes read their targets
// from a caller-owned SteppedRandom, so any number of oscillators can sample
// concurrently without sharing mutable state.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (noexcept, no allocations)
// - Principle III: Modern C++ (constexpr, [[nodiscard]], C++20)
// - Principle IX: Layer 0 (depends only on random.h / phase_utils.h)
// ==============================================================================

#pragma once

#include <wtlfo/dsp/core/phase_utils.h>
#include <wtlfo/dsp/core/random.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <string_view>

namespace Wtlfo {
namespace DSP {

// =============================================================================
// Waveform
// =============================================================================

/// @brief Available LFO waveform shapes.
enum class Waveform : uint8_t {
    Sine = 0,      ///< sin(2 pi phase)
    Triangle,      ///< -1 -> +1 over the first half, +1 -> -1 over the second
    Square,        ///< +1 below phase 0.5, -1 above
    Sawtooth,      ///< Rising: 2 phase - 1
    Ramp,          ///< Falling (reverse saw): 1 - 2 phase
    Exponential,   ///< Exponential decay from +1 to -1
    SampleHold,    ///< Random value held for each cycle
    SmoothRandom   ///< Smoothstep between successive random values
};

inline constexpr int kWaveformCount = 8;

/// Short labels as shown on the device (SIN, TRI, SQR, SAW, RMP, EXP, RND)
inline constexpr std::array<std::string_view, kWaveformCount> kWaveformLabels = {
    "SIN", "TRI", "SQR", "SAW", "RMP", "EXP", "RND", "SMO"
};

[[nodiscard]] constexpr std::string_view waveformLabel(Waveform shape) noexcept {
    const auto index = static_cast<size_t>(shape);
    return index < kWaveformLabels.size() ? kWaveformLabels[index] : std::string_view{};
}

/// True for shapes whose value jumps inside a cycle (not counting the wrap).
[[nodiscard]] constexpr bool hasInteriorDiscontinuity(Waveform shape) noexcept {
    return shape == Waveform::Square;
}

/// True for shapes that consume SteppedRandom targets.
[[nodiscard]] constexpr bool usesRandomTargets(Waveform shape) noexcept {
    return shape == Waveform::SampleHold || shape == Waveform::SmoothRandom;
}

// =============================================================================
// Shape helpers
// =============================================================================

/// Hermite smoothstep on [0, 1]: 3t^2 - 2t^3
[[nodiscard]] constexpr double smoothstep(double t) noexcept {
    t = std::clamp(t, 0.0, 1.0);
    return t * t * (3.0 - 2.0 * t);
}

/// Curvature of the exponential shape
inline constexpr double kExponentialCurve = 4.0;

namespace detail {

[[nodiscard]] inline double exponentialShape(double phase) noexcept {
    // Normalized so phase 0 -> +1 and phase 1 -> -1 exactly
    static const double kNorm = 1.0 - std::exp(-kExponentialCurve);
    const double decay = (1.0 - std::exp(-kExponentialCurve * phase)) / kNorm;
    return 1.0 - 2.0 * decay;
}

} // namespace detail

// =============================================================================
// sampleWaveform
// =============================================================================

/// @brief Sample a waveform at a normalized phase.
///
/// @param shape Waveform shape
/// @param phase Normalized phase; values outside [0, 1) are wrapped
/// @param random Random targets for SampleHold / SmoothRandom (read only)
/// @return Sample in [-1, 1]
///
/// @example
/// @code
/// SteppedRandom random(42);
/// float s = sampleWaveform(Waveform::Triangle, 0.25, random);  // 0.0
/// @endcode
[[nodiscard]] inline float sampleWaveform(
    Waveform shape,
    double phase,
    const SteppedRandom& random
) noexcept {
    if (!std::isfinite(phase)) {
        phase = 0.0;
    }
    phase = wrapPhase(phase);

    double value = 0.0;
    switch (shape) {
        case Waveform::Sine:
            value = std::sin(2.0 * std::numbers::pi * phase);
            break;
        case Waveform::Triangle:
            value = phase < 0.5 ? 4.0 * phase - 1.0 : 3.0 - 4.0 * phase;
            break;
        case Waveform::Square:
            value = phase < 0.5 ? 1.0 : -1.0;
            break;
        case Waveform::Sawtooth:
            value = 2.0 * phase - 1.0;
            break;
        case Waveform::Ramp:
            value = 1.0 - 2.0 * phase;
            break;
        case Waveform::Exponential:
            value = detail::exponentialShape(phase);
            break;
        case Waveform::SampleHold:
            value = random.target();
            break;
        case Waveform::SmoothRandom: {
            const double from = random.previous();
            const double to = random.target();
            value = from + (to - from) * smoothstep(phase);
            break;
        }
    }
    return static_cast<float>(std::clamp(value, -1.0, 1.0));
}

} // namespace DSP
} // namespace Wtlfo
