// ==============================================================================
// Layer 1: DSP Primitive - LFO (Low Frequency Oscillator)
// ==============================================================================
// One modulation voice: a PhaseEngine drives the pure waveform generator,
// the voice owns the random targets used by the random shapes, and applies
// polarity inversion, the hold-mode latch and the fade-in gain.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (noexcept, no allocations in process)
// - Principle III: Modern C++ (RAII, value semantics, C++20)
// - Principle IX: Layer 1 (depends only on Layer 0 / standard library)
// ==============================================================================

#pragma once

#include <wtlfo/dsp/core/clock_state.h>
#include <wtlfo/dsp/core/oscillator_config.h>
#include <wtlfo/dsp/core/random.h>
#include <wtlfo/dsp/core/waveform.h>
#include <wtlfo/dsp/primitives/phase_engine.h>

#include <cstdint>

namespace Wtlfo {
namespace DSP {

/// @brief One processed LFO step.
struct LfoOutput {
    float sample = 0.0f;       ///< Shape output after inversion and hold [-1, 1]
    float fadeGain = 1.0f;     ///< Fade-in envelope, multiplies depth
    double phase = 0.0;        ///< Output phase [0, 1)
    bool wrapped = false;
    bool retriggered = false;

    /// Sample scaled by the fade envelope; the value routing resolves.
    [[nodiscard]] constexpr float modulation() const noexcept { return sample * fadeGain; }
};

// =============================================================================
// LFO Class
// =============================================================================

/// @brief Low frequency oscillator voice driven by wall-clock time or MIDI clock.
class LFO {
public:
    // =========================================================================
    // Lifecycle
    // =========================================================================

    LFO() noexcept = default;

    explicit LFO(const OscillatorConfig& config) noexcept {
        configure(config);
    }

    ~LFO() = default;

    // Non-copyable, movable
    LFO(const LFO&) = delete;
    LFO& operator=(const LFO&) = delete;
    LFO(LFO&&) noexcept = default;
    LFO& operator=(LFO&&) noexcept = default;

    // =========================================================================
    // Control
    // =========================================================================

    /// @brief Apply a configuration. A changed seed restarts the random sequence.
    void configure(const OscillatorConfig& config) noexcept {
        engine_.configure(config);
        if (engine_.config().randomSeed != random_.seed()) {
            random_.reseed(engine_.config().randomSeed);
        }
    }

    [[nodiscard]] const OscillatorConfig& config() const noexcept { return engine_.config(); }

    void enable() noexcept {
        if (!engine_.isEnabled()) {
            hasHeld_ = false;
        }
        engine_.enable();
    }

    void disable() noexcept { engine_.disable(); }

    [[nodiscard]] bool isEnabled() const noexcept { return engine_.isEnabled(); }

    void retrigger() noexcept { engine_.retrigger(); }

    void setInternalTempo(double bpm) noexcept { engine_.setInternalTempo(bpm); }

    /// @brief Restart the random sequence from the configured seed.
    void resetRandom() noexcept {
        random_.reseed(engine_.config().randomSeed);
    }

    // =========================================================================
    // Processing (real-time safe)
    // =========================================================================

    /// @brief Advance and sample the voice.
    [[nodiscard]] LfoOutput process(double elapsedSeconds, const ClockState& clock) noexcept {
        const PhaseTickResult tick = engine_.tick(elapsedSeconds, clock);
        const OscillatorConfig& cfg = engine_.config();

        if (usesRandomTargets(cfg.waveform)) {
            // A new cycle or a fresh trigger draws a new random target
            const bool restarted = tick.retriggered && cfg.triggerMode != TriggerMode::Hold;
            if (tick.wrapped || restarted) {
                random_.advance();
            }
        }

        float value = sampleWaveform(cfg.waveform, tick.phase, random_);
        if (cfg.inverted) {
            value = -value;
        }

        if (cfg.triggerMode == TriggerMode::Hold) {
            if (tick.retriggered || !hasHeld_) {
                heldSample_ = value;
                hasHeld_ = true;
            }
            value = heldSample_;
        }

        LfoOutput out;
        out.sample = value;
        out.fadeGain = tick.fadeGain;
        out.phase = tick.phase;
        out.wrapped = tick.wrapped;
        out.retriggered = tick.retriggered;
        last_ = out;
        return out;
    }

    // =========================================================================
    // Query Methods
    // =========================================================================

    [[nodiscard]] const LfoOutput& lastOutput() const noexcept { return last_; }

    [[nodiscard]] const PhaseEngine& phaseEngine() const noexcept { return engine_; }

    [[nodiscard]] const SteppedRandom& random() const noexcept { return random_; }

private:
    PhaseEngine engine_;
    SteppedRandom random_;
    LfoOutput last_{};
    float heldSample_ = 0.0f;
    bool hasHeld_ = false;
};

} // namespace DSP
} // namespace Wtlfo
