// ==============================================================================
// Layer 0: Core Utility - Transport Sync
// ==============================================================================
// Musical-time math shared by the phase engine and the preset converters:
// rational rate multipliers, exact per-clock-tick phase steps, and the
// tempo-relative cycle frequency used when an oscillator runs on wall-clock
// time but follows the tempo.
//
// Clock-synced oscillators count ticks instead of measuring time. The phase
// step per tick is
//
//     multiplier / (24 * beatsPerCycle)
//
// and is kept as an integer ratio (TickStep) so a cycle of N beats wraps
// after exactly 24 * N ticks with no floating-point drift.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (noexcept, no allocation)
// - Principle III: Modern C++ (constexpr, header-only)
// - Principle IX: Layer 0 (depends only on midi_utils.h, Layer 0)
// ==============================================================================

#pragma once

#include "midi_utils.h"

#include <algorithm>
#include <cstdint>
#include <numeric>

namespace Wtlfo {
namespace DSP {

// =============================================================================
// Ratio
// =============================================================================

/// Largest numerator or denominator a rate ratio may carry. Covers the
/// Elektron MULT range (up to 2048) and 512-beat cycles while keeping the
/// 64-bit tick arithmetic far from overflow.
inline constexpr int32_t kMaxRatioTerm = 2048;

/// @brief Positive rational number (numerator / denominator).
///
/// Used for rate multipliers (1/4, 1, 2, 4) and cycle lengths in beats.
/// Non-positive parts are invalid; normalized() repairs them to 1/1.
struct Ratio {
    int32_t numerator = 1;
    int32_t denominator = 1;

    [[nodiscard]] constexpr double value() const noexcept {
        return denominator != 0
            ? static_cast<double>(numerator) / static_cast<double>(denominator)
            : 0.0;
    }

    [[nodiscard]] constexpr bool isValid() const noexcept {
        return numerator > 0 && denominator > 0;
    }

    /// Reduce to lowest terms. Invalid ratios become 1/1.
    [[nodiscard]] constexpr Ratio normalized() const noexcept {
        if (!isValid()) {
            return {};
        }
        const int32_t g = std::gcd(numerator, denominator);
        return {numerator / g, denominator / g};
    }

    /// Normalize, then clamp both terms into [1, kMaxRatioTerm].
    [[nodiscard]] constexpr Ratio bounded() const noexcept {
        const Ratio r = normalized();
        if (r.numerator <= kMaxRatioTerm && r.denominator <= kMaxRatioTerm) {
            return r;
        }
        const Ratio clamped{std::min(r.numerator, kMaxRatioTerm),
                            std::min(r.denominator, kMaxRatioTerm)};
        return clamped.normalized();
    }

    bool operator==(const Ratio&) const = default;
};

// =============================================================================
// TickStep
// =============================================================================

/// @brief Exact phase step per MIDI clock tick, in integer units.
///
/// One tick advances the cycle by unitsPerTick / unitsPerCycle.
struct TickStep {
    int64_t unitsPerTick = 1;
    int64_t unitsPerCycle = kMidiClockPpqn * 4;

    [[nodiscard]] constexpr double increment() const noexcept {
        return unitsPerCycle > 0
            ? static_cast<double>(unitsPerTick) / static_cast<double>(unitsPerCycle)
            : 0.0;
    }
};

/// @brief Calculate the exact per-tick phase step.
///
/// increment = multiplier / (24 * beatsPerCycle)
///           = (mulNum * beatsDen) / (mulDen * 24 * beatsNum)
///
/// @example
/// @code
/// // Multiplier 1, 4 beats per cycle: 96 ticks per cycle
/// auto step = calculateTickStep({1, 1}, {4, 1});
/// // step.unitsPerTick == 1, step.unitsPerCycle == 96
/// @endcode
[[nodiscard]] constexpr TickStep calculateTickStep(
    Ratio multiplier,
    Ratio beatsPerCycle
) noexcept {
    const Ratio m = multiplier.bounded();
    const Ratio b = beatsPerCycle.bounded();
    int64_t perTick = static_cast<int64_t>(m.numerator) * b.denominator;
    int64_t perCycle = static_cast<int64_t>(m.denominator) * kMidiClockPpqn * b.numerator;
    const int64_t g = std::gcd(perTick, perCycle);
    if (g > 1) {
        perTick /= g;
        perCycle /= g;
    }
    return {perTick, perCycle};
}

/// @brief Cycle frequency in Hz for a tempo-relative oscillator.
///
/// frequency = (bpm / 60) * multiplier / beatsPerCycle
///
/// @return 0.0 for non-positive tempos
[[nodiscard]] constexpr double calculateTempoCycleFrequency(
    double bpm,
    Ratio multiplier,
    Ratio beatsPerCycle
) noexcept {
    if (bpm <= 0.0) {
        return 0.0;
    }
    const double beats = beatsPerCycle.bounded().value();
    return (bpm / 60.0) * multiplier.bounded().value() / beats;
}

// =============================================================================
// Elektron speed x multiplier
// =============================================================================

/// Product of SPD x MULT that spans one bar (four beats) on Elektron devices
inline constexpr int kElektronProductPerBar = 128;

/// @brief Cycle length in beats for an Elektron LFO speed/multiplier pair.
///
/// Elektron LFOs complete one cycle every 512 / (|speed| * multiplier) beats:
/// SPD 32 x MULT 4 = 128 is one bar, 16 x 4 = 64 is two bars.
///
/// @param speed SPD value (-64..63); the sign only selects direction
/// @param multiplier MULT value (1, 2, 4 ... 2048)
/// @return Cycle length as a ratio of beats; 1/1 for a zero product
[[nodiscard]] constexpr Ratio elektronCycleBeats(int speed, int multiplier) noexcept {
    const int32_t absSpeed = speed < 0 ? -speed : speed;
    const int32_t absMultiplier = multiplier < 0 ? -multiplier : multiplier;
    const int32_t product = absSpeed * absMultiplier;
    if (product <= 0) {
        return {};
    }
    return Ratio{kElektronProductPerBar * 4, product}.normalized();
}

} // namespace DSP
} // namespace Wtlfo
