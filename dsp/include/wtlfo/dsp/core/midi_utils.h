// ==============================================================================
// Layer 0: Core Utilities
// midi_utils.h - MIDI Clock, Transport and Control Change Helpers
// ==============================================================================
// Constitution Principle II: Real-Time Audio Thread Safety
// - No allocation, no locks, no exceptions, no I/O
//
// Constitution Principle III: Modern C++ Standards
// - constexpr, const, value semantics
//
// Constitution Principle IX: Layered DSP Architecture
// - Layer 0: NO dependencies on higher layers
// ==============================================================================

#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>

namespace Wtlfo {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// MIDI clock resolution: pulses (clock ticks) per quarter note
inline constexpr int kMidiClockPpqn = 24;

/// Maximum value of a 7-bit MIDI data byte
inline constexpr int kMaxMidiDataValue = 127;

/// Number of MIDI channels
inline constexpr int kMidiChannelCount = 16;

/// Default tempo bounds used for display snapping
inline constexpr double kMinDisplayBpm = 20.0;
inline constexpr double kMaxDisplayBpm = 300.0;

/// System Real-Time status bytes
enum class MidiRealtimeStatus : uint8_t {
    TimingClock = 0xF8,
    Start = 0xFA,
    Continue = 0xFB,
    Stop = 0xFC,
    ActiveSensing = 0xFE,
    SystemReset = 0xFF
};

/// Control Change status nibble
inline constexpr uint8_t kControlChangeStatus = 0xB0;

// ==============================================================================
// Realtime messages
// ==============================================================================

/// Check whether a status byte is a System Real-Time message (0xF8-0xFF).
[[nodiscard]] constexpr bool isRealtimeStatus(uint8_t status) noexcept {
    return status >= 0xF8;
}

/// Check whether a realtime status byte carries clock or transport meaning.
///
/// Active sensing, system reset and the undefined 0xF9 / 0xFD bytes are
/// not clock-relevant and are dropped by the clock recovery path.
[[nodiscard]] constexpr bool isClockRelevantStatus(uint8_t status) noexcept {
    return status == static_cast<uint8_t>(MidiRealtimeStatus::TimingClock) ||
           status == static_cast<uint8_t>(MidiRealtimeStatus::Start) ||
           status == static_cast<uint8_t>(MidiRealtimeStatus::Continue) ||
           status == static_cast<uint8_t>(MidiRealtimeStatus::Stop);
}

// ==============================================================================
// Tempo conversion
// ==============================================================================

/// Convert a clock tick interval to beats per minute.
///
///   bpm = 60 / (interval * 24)
///
/// @param intervalSeconds Time between two consecutive clock ticks
/// @return Tempo in BPM, or 0.0 for non-positive intervals
///
/// @example tickIntervalToBpm(0.5 / 24.0) -> 120.0
[[nodiscard]] constexpr double tickIntervalToBpm(double intervalSeconds) noexcept {
    if (intervalSeconds <= 0.0) {
        return 0.0;
    }
    return 60.0 / (intervalSeconds * static_cast<double>(kMidiClockPpqn));
}

/// Convert a tempo to the clock tick interval in seconds.
/// @return Interval in seconds, or 0.0 for non-positive tempos
[[nodiscard]] constexpr double bpmToTickInterval(double bpm) noexcept {
    if (bpm <= 0.0) {
        return 0.0;
    }
    return 60.0 / (bpm * static_cast<double>(kMidiClockPpqn));
}

/// Snap a measured tempo for display.
///
/// Values within 0.3 BPM of an integer snap to it; everything else rounds to
/// the nearest 0.5 BPM. The result is clamped to [20, 300].
///
/// @example snapTempoForDisplay(119.8) -> 120.0
/// @example snapTempoForDisplay(120.4) -> 120.5
[[nodiscard]] inline double snapTempoForDisplay(double bpm) noexcept {
    const double nearestInt = std::round(bpm);
    const double snapped = std::abs(bpm - nearestInt) < 0.3
        ? nearestInt
        : std::round(bpm * 2.0) / 2.0;
    return std::clamp(snapped, kMinDisplayBpm, kMaxDisplayBpm);
}

/// Check whether a tempo moved far enough from the last reported value to be
/// worth reporting again.
[[nodiscard]] inline bool tempoChangedSignificantly(
    double reportedBpm,
    double currentBpm,
    double thresholdBpm = 0.5
) noexcept {
    return std::abs(currentBpm - reportedBpm) > thresholdBpm;
}

// ==============================================================================
// Control Change
// ==============================================================================

/// A decoded MIDI 1.0 Control Change message.
struct MidiControlChange {
    uint8_t channel = 0;     ///< 0-15
    uint8_t controller = 0;  ///< 0-127
    uint8_t value = 0;       ///< 0-127

    bool operator==(const MidiControlChange&) const = default;
};

/// Encode a Control Change message to its three wire bytes.
/// Out-of-range fields are masked to their legal bit width.
[[nodiscard]] constexpr std::array<uint8_t, 3> encodeControlChange(
    const MidiControlChange& cc
) noexcept {
    return {
        static_cast<uint8_t>(kControlChangeStatus | (cc.channel & 0x0F)),
        static_cast<uint8_t>(cc.controller & 0x7F),
        static_cast<uint8_t>(cc.value & 0x7F)
    };
}

/// Decode three wire bytes into a Control Change message.
/// @return false if the bytes are not a well-formed Control Change
[[nodiscard]] constexpr bool decodeControlChange(
    uint8_t status,
    uint8_t data1,
    uint8_t data2,
    MidiControlChange& out
) noexcept {
    if ((status & 0xF0) != kControlChangeStatus) {
        return false;
    }
    if ((data1 & 0x80) != 0 || (data2 & 0x80) != 0) {
        return false;
    }
    out.channel = static_cast<uint8_t>(status & 0x0F);
    out.controller = data1;
    out.value = data2;
    return true;
}

/// Round and clamp a parameter value to a 7-bit MIDI data byte.
///
/// Bipolar destinations (e.g. -64..63) are offset by `zeroOffset` first,
/// so pan -64 -> 0 and pan 0 -> 64 when zeroOffset is 64.
[[nodiscard]] inline uint8_t toMidiDataByte(float value, int zeroOffset = 0) noexcept {
    if (!std::isfinite(value)) {
        return static_cast<uint8_t>(std::clamp(zeroOffset, 0, kMaxMidiDataValue));
    }
    const long rounded = std::lround(value) + zeroOffset;
    return static_cast<uint8_t>(std::clamp<long>(rounded, 0, kMaxMidiDataValue));
}

} // namespace DSP
} // namespace Wtlfo
