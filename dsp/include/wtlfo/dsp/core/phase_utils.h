// ==============================================================================
// Layer 0: Core Utility - Phase Utilities
// ==============================================================================
// Normalized phase helpers shared by the phase engine and the waveform
// generator. Phase is always a double in [0, 1).
//
// Design decisions:
// - Phase uses double precision so long free-running sessions do not drift.
// - wrapPhase() handles arbitrarily large increments with std::floor, since
//   an LFO tick may cover several cycles after a long scheduler stall.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (noexcept, no allocations)
// - Principle III: Modern C++ (constexpr, [[nodiscard]], C++20)
// - Principle IX: Layer 0 (depends only on stdlib)
// ==============================================================================

#pragma once

#include <cmath>
#include <cstdint>

namespace Wtlfo {
namespace DSP {

/// @brief Largest phase value strictly below 1.0.
///
/// Used as the hold position of one-shot cycles so that a held phase still
/// satisfies the [0, 1) contract while sampling the final waveform value.
inline constexpr double kPhaseHoldMax = 0.99999999999999989;

/// @brief Wrap phase to [0, 1).
///
/// @param phase Any finite phase value
/// @return Phase wrapped to [0, 1)
///
/// @example
/// @code
/// double a = wrapPhase(1.3);   // 0.3
/// double b = wrapPhase(-0.2);  // 0.8
/// double c = wrapPhase(7.0);   // 0.0
/// @endcode
[[nodiscard]] inline double wrapPhase(double phase) noexcept {
    if (phase >= 0.0 && phase < 1.0) {
        return phase;
    }
    double wrapped = phase - std::floor(phase);
    // floor() of a value just below an integer can round up
    if (wrapped >= 1.0) {
        wrapped = 0.0;
    }
    return wrapped;
}

/// @brief Detect whether a forward-moving phase wrapped between two reads.
/// @param currentPhase Phase after advancing [0, 1)
/// @param previousPhase Phase before advancing [0, 1)
/// @param advance Amount the phase was advanced by (>= 0)
[[nodiscard]] constexpr bool detectPhaseWrap(
    double currentPhase,
    double previousPhase,
    double advance
) noexcept {
    return advance >= 1.0 || (advance > 0.0 && currentPhase < previousPhase);
}

/// @brief Normalize a phase offset given in degrees to [0, 1).
[[nodiscard]] inline double degreesToPhase(double degrees) noexcept {
    return wrapPhase(degrees / 360.0);
}

/// @brief Clamp a cycle progress value into [0, limit] and report saturation.
/// @param progress Unclamped progress in cycles
/// @param limit Saturation point in cycles (1.0 one-shot, 0.5 half-shot)
/// @param saturated Set to true when progress reached the limit
[[nodiscard]] constexpr double clampProgress(
    double progress,
    double limit,
    bool& saturated
) noexcept {
    if (progress >= limit) {
        saturated = true;
        return limit;
    }
    saturated = false;
    return progress < 0.0 ? 0.0 : progress;
}

} // namespace DSP
} // namespace Wtlfo
