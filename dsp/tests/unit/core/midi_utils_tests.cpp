// ==============================================================================
// MIDI Utilities - Unit Tests
// ==============================================================================
// Layer 0: Core Utilities
//
// Tests for: dsp/include/wtlfo/dsp/core/midi_utils.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <wtlfo/dsp/core/midi_utils.h>

#include <cmath>
#include <limits>

using namespace Wtlfo::DSP;
using Catch::Approx;

// ==============================================================================
// Realtime status classification
// ==============================================================================

TEST_CASE("isRealtimeStatus accepts only 0xF8-0xFF", "[dsp][core][midi_utils]") {
    CHECK(isRealtimeStatus(0xF8));
    CHECK(isRealtimeStatus(0xFE));
    CHECK(isRealtimeStatus(0xFF));
    CHECK_FALSE(isRealtimeStatus(0xF7));
    CHECK_FALSE(isRealtimeStatus(0x90));
    CHECK_FALSE(isRealtimeStatus(0x00));
}

TEST_CASE("isClockRelevantStatus keeps clock and transport only", "[dsp][core][midi_utils]") {
    CHECK(isClockRelevantStatus(0xF8));
    CHECK(isClockRelevantStatus(0xFA));
    CHECK(isClockRelevantStatus(0xFB));
    CHECK(isClockRelevantStatus(0xFC));

    SECTION("active sensing, reset and undefined bytes are ignored") {
        CHECK_FALSE(isClockRelevantStatus(0xF9));
        CHECK_FALSE(isClockRelevantStatus(0xFD));
        CHECK_FALSE(isClockRelevantStatus(0xFE));
        CHECK_FALSE(isClockRelevantStatus(0xFF));
    }
}

// ==============================================================================
// Tempo conversion
// ==============================================================================

TEST_CASE("tickIntervalToBpm uses 24 pulses per quarter note", "[dsp][core][midi_utils][tempo]") {
    // 120 BPM -> 0.5 s per beat -> 1/48 s per tick
    CHECK(tickIntervalToBpm(0.5 / 24.0) == Approx(120.0).margin(1e-9));
    CHECK(tickIntervalToBpm(1.0 / 24.0) == Approx(60.0).margin(1e-9));

    SECTION("non-positive intervals give 0") {
        CHECK(tickIntervalToBpm(0.0) == 0.0);
        CHECK(tickIntervalToBpm(-0.01) == 0.0);
    }
}

TEST_CASE("bpmToTickInterval is the inverse of tickIntervalToBpm", "[dsp][core][midi_utils][tempo]") {
    for (double bpm : {20.0, 90.0, 120.0, 174.0, 300.0}) {
        CHECK(tickIntervalToBpm(bpmToTickInterval(bpm)) == Approx(bpm).margin(1e-9));
    }
    CHECK(bpmToTickInterval(0.0) == 0.0);
}

TEST_CASE("snapTempoForDisplay snaps to integers or halves", "[dsp][core][midi_utils][tempo]") {
    CHECK(snapTempoForDisplay(119.8) == 120.0);
    CHECK(snapTempoForDisplay(120.2) == 120.0);
    CHECK(snapTempoForDisplay(120.4) == 120.5);
    CHECK(snapTempoForDisplay(120.6) == 120.5);

    SECTION("result is clamped to the display range") {
        CHECK(snapTempoForDisplay(5.0) == kMinDisplayBpm);
        CHECK(snapTempoForDisplay(999.0) == kMaxDisplayBpm);
    }
}

TEST_CASE("tempoChangedSignificantly uses a 0.5 BPM default threshold", "[dsp][core][midi_utils][tempo]") {
    CHECK_FALSE(tempoChangedSignificantly(120.0, 120.4));
    CHECK(tempoChangedSignificantly(120.0, 120.6));
    CHECK(tempoChangedSignificantly(120.0, 119.4));
    CHECK(tempoChangedSignificantly(120.0, 121.0, 0.9));
    CHECK_FALSE(tempoChangedSignificantly(120.0, 121.0, 2.0));
}

// ==============================================================================
// Control Change
// ==============================================================================

TEST_CASE("encodeControlChange builds a three byte message", "[dsp][core][midi_utils][cc]") {
    MidiControlChange cc;
    cc.channel = 3;
    cc.controller = 74;
    cc.value = 100;
    const auto bytes = encodeControlChange(cc);
    CHECK(bytes[0] == 0xB3);
    CHECK(bytes[1] == 74);
    CHECK(bytes[2] == 100);

    SECTION("out-of-range fields are masked to seven bits") {
        cc.channel = 0x1F;
        cc.controller = 0xFF;
        cc.value = 0x80;
        const auto masked = encodeControlChange(cc);
        CHECK(masked[0] == 0xBF);
        CHECK(masked[1] == 0x7F);
        CHECK(masked[2] == 0x00);
    }
}

TEST_CASE("decodeControlChange rejects non-CC status and data with the high bit", "[dsp][core][midi_utils][cc]") {
    MidiControlChange out;
    REQUIRE(decodeControlChange(0xB5, 7, 64, out));
    CHECK(out.channel == 5);
    CHECK(out.controller == 7);
    CHECK(out.value == 64);

    CHECK_FALSE(decodeControlChange(0x95, 60, 100, out));
    CHECK_FALSE(decodeControlChange(0xB0, 0x80, 1, out));
    CHECK_FALSE(decodeControlChange(0xB0, 1, 0x80, out));
}

TEST_CASE("toMidiDataByte rounds, offsets and clamps", "[dsp][core][midi_utils][cc]") {
    CHECK(toMidiDataByte(63.4f) == 63);
    CHECK(toMidiDataByte(63.6f) == 64);
    CHECK(toMidiDataByte(-5.0f) == 0);
    CHECK(toMidiDataByte(500.0f) == 127);

    SECTION("bipolar range with an offset of 64") {
        CHECK(toMidiDataByte(-64.0f, 64) == 0);
        CHECK(toMidiDataByte(0.0f, 64) == 64);
        CHECK(toMidiDataByte(63.0f, 64) == 127);
    }

    SECTION("NaN maps to the zero point") {
        CHECK(toMidiDataByte(std::numeric_limits<float>::quiet_NaN()) == 0);
        CHECK(toMidiDataByte(std::numeric_limits<float>::quiet_NaN(), 64) == 64);
    }
}
