// ==============================================================================
// Layer 0: Core Utilities
// random.h - Seedable Pseudo-Random State for Random LFO Shapes
// ==============================================================================
// Constitution Principle II: Real-Time Audio Thread Safety
// - No allocation, no locks, no exceptions, no I/O
//
// Constitution Principle III: Modern C++ Standards
// - constexpr where possible, const, value semantics
//
// Constitution Principle IX: Layered DSP Architecture
// - Layer 0: NO dependencies on higher layers
// ==============================================================================

#pragma once

#include <cstdint>

namespace Wtlfo {
namespace DSP {

// ==============================================================================
// Xorshift32 PRNG
// ==============================================================================

/// Fast 32-bit pseudo-random number generator using xorshift (13, 17, 5).
///
/// Deterministic for a given seed so random LFO shapes are reproducible.
///
/// @note NOT cryptographically secure
///
/// @example
///     Xorshift32 rng(12345);
///     float value = rng.nextFloat();  // [-1.0, 1.0]
///
class Xorshift32 {
public:
    /// @param seedValue Initial seed (0 is replaced with the default seed)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// @return Random uint32_t in range [1, 2^32-1]
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// @return Random float in range [-1.0, 1.0]
    [[nodiscard]] constexpr float nextFloat() noexcept {
        return static_cast<float>(next()) * kToFloat * 2.0f - 1.0f;
    }

    /// @return Random float in range [0.0, 1.0]
    [[nodiscard]] constexpr float nextUnipolar() noexcept {
        return static_cast<float>(next()) * kToFloat;
    }

    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    [[nodiscard]] constexpr uint32_t state() const noexcept {
        return state_;
    }

private:
    /// Used when 0 is passed (0 would make xorshift output only zeros)
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// 1.0 / (2^32 - 1)
    static constexpr float kToFloat = 2.3283064370807974e-10f;

    uint32_t state_;
};

// ==============================================================================
// SteppedRandom
// ==============================================================================

/// Random targets for the sample-and-hold and smooth-random LFO shapes.
///
/// The waveform generator is a pure function; the "last target" these shapes
/// need lives here, owned by whoever owns the oscillator. Each oscillator
/// carries its own instance, so several oscillators never share state.
///
/// advance() is called once per cycle, at phase wrap:
///   previous <- target, target <- next random value
///
/// Sample-and-hold reads target(); smooth-random interpolates
/// previous() -> target() across the cycle.
class SteppedRandom {
public:
    explicit constexpr SteppedRandom(uint32_t seedValue = kDefaultLfoSeed) noexcept
        : rng_(seedValue) {
        reseed(seedValue);
    }

    /// Restart the sequence. The first cycle interpolates between the first
    /// two values drawn.
    constexpr void reseed(uint32_t seedValue) noexcept {
        seed_ = seedValue;
        rng_.seed(seedValue);
        previous_ = rng_.nextFloat();
        target_ = rng_.nextFloat();
    }

    /// Draw the next target at a cycle boundary.
    constexpr void advance() noexcept {
        previous_ = target_;
        target_ = rng_.nextFloat();
    }

    [[nodiscard]] constexpr float previous() const noexcept { return previous_; }
    [[nodiscard]] constexpr float target() const noexcept { return target_; }
    [[nodiscard]] constexpr uint32_t seed() const noexcept { return seed_; }

    static constexpr uint32_t kDefaultLfoSeed = 12345u;

private:
    Xorshift32 rng_;
    uint32_t seed_ = kDefaultLfoSeed;
    float previous_ = 0.0f;
    float target_ = 0.0f;
};

} // namespace DSP
} // namespace Wtlfo
