// ==============================================================================
// Layer 0: Core Utility - Clock State
// ==============================================================================
// Plain data shared between the clock recovery unit (writer) and its readers
// (phase engine, engine snapshots, UI). Kept trivially copyable so it can be
// published through a SnapshotCell.
//
// Constitution Compliance:
// - Principle III: Modern C++ (value semantics)
// - Principle IX: Layer 0 (depends only on Layer 0)
// ==============================================================================

#pragma once

#include <wtlfo/dsp/core/midi_utils.h>

#include <cstdint>
#include <type_traits>

namespace Wtlfo {
namespace DSP {

/// @brief Kind of inbound clock / transport event.
enum class ClockEventType : uint8_t {
    Tick = 0,   ///< 0xF8 timing clock
    Start,      ///< 0xFA
    Stop,       ///< 0xFC
    Continue    ///< 0xFB
};

/// @brief Timestamped clock or transport event.
///
/// Timestamps are seconds on a monotonic clock shared with the scheduler.
struct ClockEvent {
    ClockEventType type = ClockEventType::Tick;
    double timestamp = 0.0;
};

/// @brief Last transport message that changed the transport epoch.
enum class TransportEvent : uint8_t {
    None = 0,
    Start,
    Continue,
    Stop
};

/// @brief Snapshot of the recovered clock.
struct ClockState {
    bool running = false;
    bool tempoKnown = false;          ///< False until one valid interval was measured
    double tempoBpm = 0.0;            ///< Smoothed estimate; 0 while unknown
    int64_t songPositionTicks = 0;    ///< Ticks since the last start (kept by continue)
    int64_t runningTicks = 0;         ///< Ticks received while running since reset
    bool hasLastTick = false;
    double lastTickTime = 0.0;
    bool hasActivity = false;
    double lastActivityTime = 0.0;    ///< Timestamp of the newest accepted event
    double silenceSince = 0.0;        ///< Newest tick, or the first event after silence
    uint32_t transportEpoch = 0;      ///< Incremented by every start and continue
    TransportEvent lastTransportEvent = TransportEvent::None;
    uint32_t glitchCount = 0;

    /// Tempo in BPM, or 0.0 when unknown.
    [[nodiscard]] constexpr double tempo() const noexcept {
        return tempoKnown ? tempoBpm : 0.0;
    }

    /// Current position in quarter notes since the last start.
    [[nodiscard]] constexpr double songPositionBeats() const noexcept {
        return static_cast<double>(songPositionTicks) / static_cast<double>(kMidiClockPpqn);
    }
};

static_assert(std::is_trivially_copyable_v<ClockState>);

/// @brief Map a raw realtime status byte to a clock event.
/// @return false for bytes that carry no clock or transport meaning
[[nodiscard]] constexpr bool clockEventFromStatus(
    uint8_t status,
    double timestamp,
    ClockEvent& out
) noexcept {
    switch (static_cast<MidiRealtimeStatus>(status)) {
        case MidiRealtimeStatus::TimingClock:
            out = {ClockEventType::Tick, timestamp};
            return true;
        case MidiRealtimeStatus::Start:
            out = {ClockEventType::Start, timestamp};
            return true;
        case MidiRealtimeStatus::Continue:
            out = {ClockEventType::Continue, timestamp};
            return true;
        case MidiRealtimeStatus::Stop:
            out = {ClockEventType::Stop, timestamp};
            return true;
        default:
            return false;
    }
}

} // namespace DSP
} // namespace Wtlfo
