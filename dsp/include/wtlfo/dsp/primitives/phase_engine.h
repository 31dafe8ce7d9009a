// ==============================================================================
// Layer 1: DSP Primitive - Phase Engine
// ==============================================================================
// Advances the phase of one oscillator, either on wall-clock time (free
// timebase) or by counting received MIDI clock ticks (clock-synced timebase).
//
// States:
//   Stopped        not enabled, or clock-synced while the clock is stopped
//   RunningFree    free timebase, advances by frequency x elapsed seconds
//   RunningSynced  clock-synced and the clock is running
//
// A clock-synced oscillator never falls back to the free timebase: when the
// clock stops it stops too and resumes when the clock runs again.
//
// Synced progress is counted in integer units (see TickStep) so a cycle of N
// beats wraps after exactly 24 x N ticks.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (noexcept, no allocation)
// - Principle III: Modern C++ (C++20)
// - Principle IX: Layer 1 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include <wtlfo/dsp/core/clock_state.h>
#include <wtlfo/dsp/core/oscillator_config.h>
#include <wtlfo/dsp/core/phase_utils.h>
#include <wtlfo/dsp/core/transport_sync.h>

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace Wtlfo {
namespace DSP {

inline constexpr double kDefaultInternalTempo = 120.0;

/// @brief Phase engine run state.
enum class PhaseEngineState : uint8_t {
    Stopped = 0,
    RunningFree,
    RunningSynced
};

/// @brief Result of one PhaseEngine::tick().
struct PhaseTickResult {
    double phase = 0.0;        ///< Output phase in [0, 1), offset applied
    bool wrapped = false;      ///< Output phase crossed 1.0 during this tick
    bool retriggered = false;  ///< A trigger (explicit or transport) was applied
    bool finished = false;     ///< Shot modes: the shot has reached its end
    float fadeGain = 1.0f;     ///< Fade-in envelope on depth [0, 1]
};

/// @brief Per-oscillator phase state machine.
///
/// Owned by the scheduler context. The ClockState passed to tick() is a
/// snapshot; the engine keeps its own counters to turn snapshots into tick
/// deltas and transport edges.
class PhaseEngine {
public:
    PhaseEngine() noexcept { configure(OscillatorConfig{}); }

    explicit PhaseEngine(const OscillatorConfig& config) noexcept {
        configure(config);
    }

    // =========================================================================
    // Control
    // =========================================================================

    /// @brief Apply a configuration. Progress through the cycle is kept.
    void configure(const OscillatorConfig& config) noexcept {
        const OscillatorConfig next = sanitize(config);
        const TickStep nextStep = calculateTickStep(next.multiplier, next.beatsPerCycle);

        // Rescale integer progress onto the new cycle length
        if (nextStep.unitsPerCycle != step_.unitsPerCycle && step_.unitsPerCycle > 0) {
            units_ = units_ * nextStep.unitsPerCycle / step_.unitsPerCycle;
        }

        config_ = next;
        step_ = nextStep;
        if (!isShotMode(config_.triggerMode)) {
            units_ %= step_.unitsPerCycle;
            freeProgress_ = wrapPhase(freeProgress_);
            finished_ = false;
        }
    }

    [[nodiscard]] const OscillatorConfig& config() const noexcept { return config_; }

    /// @brief Start the oscillator from the beginning of its cycle.
    ///
    /// Free timebase enters RunningFree. Clock-synced enters RunningSynced
    /// on the next tick if the clock is running, and waits in Stopped
    /// otherwise. No effect if already enabled.
    void enable() noexcept {
        if (enabled_) {
            return;
        }
        enabled_ = true;
        needsBaseline_ = true;
        restart();
        pendingTrigger_ = config_.triggerMode != TriggerMode::Free;
    }

    /// @brief Stop and disarm. Phase is frozen at its current value.
    void disable() noexcept {
        enabled_ = false;
        pendingTrigger_ = false;
        state_ = PhaseEngineState::Stopped;
    }

    [[nodiscard]] bool isEnabled() const noexcept { return enabled_; }

    /// @brief Request an explicit retrigger (e.g. a note trig), applied on
    /// the next tick. Ignored by the Free trigger mode.
    void retrigger() noexcept {
        if (enabled_ && config_.triggerMode != TriggerMode::Free) {
            pendingTrigger_ = true;
        }
    }

    /// @brief Tempo used by tempo-relative rates while the clock tempo is
    /// unknown.
    void setInternalTempo(double bpm) noexcept {
        if (std::isfinite(bpm) && bpm > 0.0) {
            internalTempo_ = bpm;
        }
    }

    [[nodiscard]] double internalTempo() const noexcept { return internalTempo_; }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Advance the phase.
    ///
    /// @param elapsedSeconds Wall-clock time since the previous tick (free timebase)
    /// @param clock Clock snapshot, timeout already applied
    [[nodiscard]] PhaseTickResult tick(double elapsedSeconds, const ClockState& clock) noexcept {
        PhaseTickResult result;

        if (!enabled_) {
            state_ = PhaseEngineState::Stopped;
            result.phase = outputPhase();
            result.finished = finished_;
            result.fadeGain = fadeGain();
            return result;
        }

        if (needsBaseline_ || clock.runningTicks < lastRunningTicks_) {
            lastRunningTicks_ = clock.runningTicks;
            lastEpoch_ = clock.transportEpoch;
            needsBaseline_ = false;
        }

        int64_t tickDelta = clock.runningTicks - lastRunningTicks_;
        lastRunningTicks_ = clock.runningTicks;

        if (config_.timebase == Timebase::Free) {
            state_ = PhaseEngineState::RunningFree;
        } else {
            state_ = clock.running ? PhaseEngineState::RunningSynced : PhaseEngineState::Stopped;
        }

        if (pendingTrigger_) {
            pendingTrigger_ = false;
            applyTrigger(result);
        }

        if (clock.transportEpoch != lastEpoch_) {
            lastEpoch_ = clock.transportEpoch;
            if (reactsToTransport(clock.lastTransportEvent)) {
                applyTrigger(result);
                // Only ticks received after the start count towards the new cycle
                if (clock.lastTransportEvent == TransportEvent::Start) {
                    tickDelta = std::min(tickDelta, clock.songPositionTicks);
                }
            }
        }

        const double previousPhase = outputPhase();
        double advance = 0.0;

        if (state_ == PhaseEngineState::RunningSynced && tickDelta > 0) {
            advance = advanceSynced(tickDelta);
        } else if (state_ == PhaseEngineState::RunningFree &&
                   std::isfinite(elapsedSeconds) && elapsedSeconds > 0.0) {
            advance = advanceFree(elapsedSeconds, clock);
        }

        result.phase = outputPhase();
        result.wrapped = detectPhaseWrap(result.phase, previousPhase, advance);
        result.finished = finished_;
        result.fadeGain = fadeGain();
        return result;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] PhaseEngineState state() const noexcept { return state_; }

    /// Output phase in [0, 1) with the offset applied.
    [[nodiscard]] double phase() const noexcept { return outputPhase(); }

    /// Progress through the current cycle before the offset, in cycles.
    [[nodiscard]] double progress() const noexcept {
        if (config_.timebase == Timebase::ClockSync) {
            return static_cast<double>(units_) / static_cast<double>(step_.unitsPerCycle);
        }
        return freeProgress_;
    }

    [[nodiscard]] TickStep tickStep() const noexcept { return step_; }

    /// Current cycle frequency in Hz for the free timebase.
    [[nodiscard]] double frequency(const ClockState& clock) const noexcept {
        if (config_.speedMode == SpeedMode::Hertz) {
            return static_cast<double>(config_.speedHz);
        }
        const double tempo = clock.tempoKnown ? clock.tempoBpm : internalTempo_;
        return calculateTempoCycleFrequency(tempo, config_.multiplier, config_.beatsPerCycle);
    }

    [[nodiscard]] float fadeGain() const noexcept {
        if (config_.fadeIn <= 0.0f) {
            return 1.0f;
        }
        return static_cast<float>(std::min(1.0, fadeElapsed_ / static_cast<double>(config_.fadeIn)));
    }

private:
    [[nodiscard]] bool reactsToTransport(TransportEvent event) const noexcept {
        switch (config_.triggerMode) {
            case TriggerMode::Free:
                return false;
            case TriggerMode::Trigger:
            case TriggerMode::Hold:
                return event == TransportEvent::Start;
            case TriggerMode::OneShot:
            case TriggerMode::HalfShot:
                return event == TransportEvent::Start || event == TransportEvent::Continue;
        }
        return false;
    }

    void applyTrigger(PhaseTickResult& result) noexcept {
        result.retriggered = true;
        // Hold keeps the phase running and only latches the output
        if (config_.triggerMode != TriggerMode::Hold) {
            restart();
        }
    }

    void restart() noexcept {
        units_ = 0;
        freeProgress_ = 0.0;
        fadeElapsed_ = 0.0;
        finished_ = false;
    }

    double advanceSynced(int64_t ticks) noexcept {
        const double before = progress();
        const double cycles = static_cast<double>(ticks) * step_.increment();
        fadeElapsed_ += cycles;

        if (isShotMode(config_.triggerMode)) {
            if (finished_) {
                return 0.0;
            }
            // Cap at one cycle so the counter cannot overflow while holding
            units_ = std::min(units_ + ticks * step_.unitsPerTick, step_.unitsPerCycle);
            bool saturated = false;
            const double limited = clampProgress(progress(), shotLength(config_.triggerMode), saturated);
            finished_ = saturated;
            return limited - before;
        }

        const int64_t total = units_ + ticks * step_.unitsPerTick;
        units_ = total % step_.unitsPerCycle;
        return cycles;
    }

    double advanceFree(double elapsedSeconds, const ClockState& clock) noexcept {
        fadeElapsed_ += elapsedSeconds;
        const double cycles = frequency(clock) * elapsedSeconds;

        if (isShotMode(config_.triggerMode)) {
            if (finished_) {
                return 0.0;
            }
            const double before = freeProgress_;
            bool saturated = false;
            freeProgress_ = clampProgress(freeProgress_ + cycles, shotLength(config_.triggerMode), saturated);
            finished_ = saturated;
            return freeProgress_ - before;
        }

        freeProgress_ = wrapPhase(freeProgress_ + cycles);
        return cycles;
    }

    [[nodiscard]] double outputPhase() const noexcept {
        double cycleProgress = progress();
        if (isShotMode(config_.triggerMode)) {
            cycleProgress = std::min(cycleProgress, shotLength(config_.triggerMode));
        }
        const double phase = wrapPhase(config_.phaseOffset + cycleProgress);
        // A finished shot that ends on the cycle boundary holds just below it
        if (finished_ && phase == 0.0) {
            return kPhaseHoldMax;
        }
        return phase;
    }

    OscillatorConfig config_{};
    TickStep step_{};
    PhaseEngineState state_ = PhaseEngineState::Stopped;

    int64_t units_ = 0;           ///< Synced progress in TickStep units
    double freeProgress_ = 0.0;   ///< Free progress in cycles
    double fadeElapsed_ = 0.0;    ///< Seconds (free) or cycles (synced)
    double internalTempo_ = kDefaultInternalTempo;

    int64_t lastRunningTicks_ = 0;
    uint32_t lastEpoch_ = 0;

    bool enabled_ = false;
    bool needsBaseline_ = true;
    bool pendingTrigger_ = false;
    bool finished_ = false;
};

} // namespace DSP
} // namespace Wtlfo
