// ==============================================================================
// Layer 1: DSP Primitive - Clock Recovery
// ==============================================================================
// Recovers tempo and transport state from a stream of timestamped MIDI
// realtime events (timing clock, start, stop, continue).
//
// Tempo is estimated from inter-tick intervals at 24 ppqn and smoothed with
// an exponential moving average. Intervals implying a tempo outside the
// configured bounds are counted as glitches and never reach the average.
//
// The silence timeout is measured from the newest tick. Transport events do
// not keep a device alive; only the first event after silence (or reset)
// opens a fresh window for ticks to arrive.
//
// Threading: ingest() and reset() form the single writer and must be called
// from one context. currentState() may be called from any thread; it reads a
// SnapshotCell and never blocks the writer.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (noexcept, no allocation, lock-free reads)
// - Principle III: Modern C++ (C++20)
// - Principle IX: Layer 1 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include <wtlfo/dsp/core/clock_state.h>
#include <wtlfo/dsp/core/midi_utils.h>
#include <wtlfo/dsp/core/snapshot_cell.h>

#include <atomic>
#include <cmath>
#include <cstdint>

namespace Wtlfo {
namespace DSP {

// =============================================================================
// Configuration
// =============================================================================

inline constexpr double kDefaultClockSmoothing = 0.15;
inline constexpr double kDefaultMinClockBpm = 20.0;
inline constexpr double kDefaultMaxClockBpm = 300.0;
inline constexpr double kDefaultClockTimeoutSeconds = 2.0;

/// @brief Tuning of the clock recovery unit.
struct ClockRecoveryConfig {
    double smoothing = kDefaultClockSmoothing;      ///< EMA weight of the newest interval (0, 1]
    double minBpm = kDefaultMinClockBpm;
    double maxBpm = kDefaultMaxClockBpm;
    double timeoutSeconds = kDefaultClockTimeoutSeconds;
    /// Relative outlier rejection. An interval further than this factor from
    /// the current estimate's interval is a glitch. Values <= 1 disable it.
    double outlierRatio = 0.0;
    bool receiveClock = true;       ///< Ignore timing clock ticks when false
    bool receiveTransport = true;   ///< Ignore start / stop / continue when false
};

// =============================================================================
// ClockRecovery
// =============================================================================

/// @brief MIDI clock tempo and transport recovery.
///
/// @example
/// @code
/// ClockRecovery clock;
/// clock.ingest({ClockEventType::Start, 0.0});
/// for (int i = 0; i <= 24; ++i)
///     clock.ingest({ClockEventType::Tick, i * (0.5 / 24.0)});
/// ClockState s = clock.currentState();  // running, tempo ~120
/// @endcode
class ClockRecovery {
public:
    ClockRecovery() noexcept = default;

    explicit ClockRecovery(const ClockRecoveryConfig& config) noexcept {
        setConfig(config);
    }

    ClockRecovery(const ClockRecovery&) = delete;
    ClockRecovery& operator=(const ClockRecovery&) = delete;

    // =========================================================================
    // Writer side
    // =========================================================================

    /// @brief Replace the tuning. Writer context only.
    ///
    /// Invalid values are repaired: smoothing is clamped to (0, 1], bounds
    /// are reordered, non-positive timeouts disable the timeout.
    void setConfig(const ClockRecoveryConfig& config) noexcept {
        config_ = config;
        if (!std::isfinite(config_.smoothing) || config_.smoothing <= 0.0) {
            config_.smoothing = kDefaultClockSmoothing;
        }
        if (config_.smoothing > 1.0) {
            config_.smoothing = 1.0;
        }
        if (!std::isfinite(config_.minBpm) || config_.minBpm <= 0.0) {
            config_.minBpm = kDefaultMinClockBpm;
        }
        if (!std::isfinite(config_.maxBpm) || config_.maxBpm <= 0.0) {
            config_.maxBpm = kDefaultMaxClockBpm;
        }
        if (config_.minBpm > config_.maxBpm) {
            const double tmp = config_.minBpm;
            config_.minBpm = config_.maxBpm;
            config_.maxBpm = tmp;
        }
        if (!std::isfinite(config_.timeoutSeconds)) {
            config_.timeoutSeconds = 0.0;
        }
        if (!std::isfinite(config_.outlierRatio)) {
            config_.outlierRatio = 0.0;
        }
        timeoutSeconds_.store(config_.timeoutSeconds, std::memory_order_relaxed);
    }

    [[nodiscard]] const ClockRecoveryConfig& config() const noexcept { return config_; }

    /// @brief Feed one event.
    /// @return true if the event was accepted, false if it was dropped
    ///         (reception disabled or non-finite timestamp)
    bool ingest(const ClockEvent& event) noexcept {
        if (!std::isfinite(event.timestamp)) {
            return false;
        }

        if (event.type == ClockEventType::Tick) {
            if (!config_.receiveClock) {
                return false;
            }
            beginActivity(event.timestamp);
            handleTick(event.timestamp);
            state_.silenceSince = event.timestamp;
        } else {
            if (!config_.receiveTransport) {
                return false;
            }
            beginActivity(event.timestamp);
            handleTransport(event.type);
        }

        state_.lastActivityTime = event.timestamp;
        cell_.publish(state_);
        return true;
    }

    /// @brief Feed a raw realtime status byte.
    /// @return false for bytes without clock meaning or dropped events
    bool ingestStatusByte(uint8_t status, double timestamp) noexcept {
        ClockEvent event;
        if (!clockEventFromStatus(status, timestamp, event)) {
            return false;
        }
        return ingest(event);
    }

    /// @brief Forget everything: not running, tempo unknown, counters zeroed.
    void reset() noexcept {
        state_ = ClockState{};
        cell_.publish(state_);
    }

    // =========================================================================
    // Reader side (any thread)
    // =========================================================================

    /// @brief Latest published state, without the silence timeout applied.
    [[nodiscard]] ClockState currentState() const noexcept {
        return cell_.load();
    }

    /// @brief Latest published state as seen at time `now`.
    ///
    /// If no tick arrived for longer than the timeout, the device is
    /// considered silent: running=false and tempo unknown. Counters and the
    /// epoch are preserved. Does not modify the unit.
    [[nodiscard]] ClockState currentState(double now) const noexcept {
        return applyTimeout(cell_.load(), now, timeoutSeconds_.load(std::memory_order_relaxed));
    }

    /// @brief Apply the silence timeout to a snapshot.
    [[nodiscard]] static ClockState applyTimeout(
        ClockState state,
        double now,
        double timeoutSeconds
    ) noexcept {
        if (timeoutSeconds > 0.0 && state.hasActivity &&
            now - state.silenceSince > timeoutSeconds) {
            state.running = false;
            state.tempoKnown = false;
            state.tempoBpm = 0.0;
        }
        return state;
    }

private:
    // A gap longer than the timeout means the device went silent. Estimation
    // restarts from scratch and the transport is considered stopped.
    void beginActivity(double timestamp) noexcept {
        if (!state_.hasActivity) {
            state_.hasActivity = true;
            state_.silenceSince = timestamp;
            return;
        }
        if (config_.timeoutSeconds > 0.0 &&
            timestamp - state_.silenceSince > config_.timeoutSeconds) {
            state_.running = false;
            state_.tempoKnown = false;
            state_.tempoBpm = 0.0;
            state_.hasLastTick = false;
            state_.silenceSince = timestamp;
        }
    }

    void handleTick(double timestamp) noexcept {
        if (state_.hasLastTick) {
            const double interval = timestamp - state_.lastTickTime;
            if (interval <= 0.0 || tickIntervalToBpm(interval) > config_.maxBpm) {
                // Duplicate, reordered or spurious tick: the last good tick
                // stays the anchor and the tick does not count
                ++state_.glitchCount;
                return;
            }
            if (isGlitch(interval)) {
                ++state_.glitchCount;
            } else {
                foldInterval(interval);
            }
            state_.lastTickTime = timestamp;
        } else {
            state_.hasLastTick = true;
            state_.lastTickTime = timestamp;
        }

        if (state_.running) {
            ++state_.songPositionTicks;
            ++state_.runningTicks;
        }
    }

    void handleTransport(ClockEventType type) noexcept {
        switch (type) {
            case ClockEventType::Start:
                state_.songPositionTicks = 0;
                state_.running = true;
                ++state_.transportEpoch;
                state_.lastTransportEvent = TransportEvent::Start;
                break;
            case ClockEventType::Continue:
                state_.running = true;
                ++state_.transportEpoch;
                state_.lastTransportEvent = TransportEvent::Continue;
                break;
            case ClockEventType::Stop:
                state_.running = false;
                state_.lastTransportEvent = TransportEvent::Stop;
                break;
            case ClockEventType::Tick:
                break;
        }
    }

    [[nodiscard]] bool isGlitch(double interval) const noexcept {
        const double bpm = tickIntervalToBpm(interval);
        if (bpm < config_.minBpm || bpm > config_.maxBpm) {
            return true;
        }
        if (config_.outlierRatio > 1.0 && state_.tempoKnown) {
            const double expected = bpmToTickInterval(state_.tempoBpm);
            if (interval < expected / config_.outlierRatio ||
                interval > expected * config_.outlierRatio) {
                return true;
            }
        }
        return false;
    }

    void foldInterval(double interval) noexcept {
        const double bpm = tickIntervalToBpm(interval);
        if (!state_.tempoKnown) {
            state_.tempoBpm = bpm;
            state_.tempoKnown = true;
            return;
        }
        state_.tempoBpm += config_.smoothing * (bpm - state_.tempoBpm);
    }

    ClockRecoveryConfig config_{};
    ClockState state_{};             ///< Writer-owned working copy
    SnapshotCell<ClockState> cell_;  ///< Published copy for readers
    std::atomic<double> timeoutSeconds_{kDefaultClockTimeoutSeconds};  ///< Read by currentState(now)
};

} // namespace DSP
} // namespace Wtlfo
