// ==============================================================================
// Transport Sync - Unit Tests
// ==============================================================================
// Layer 0: Core Utilities
//
// Tests for: dsp/include/wtlfo/dsp/core/transport_sync.h
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <wtlfo/dsp/core/transport_sync.h>

using namespace Wtlfo::DSP;
using Catch::Approx;

TEST_CASE("Ratio normalization", "[dsp][core][transport_sync]") {
    CHECK(Ratio{2, 4}.normalized() == Ratio{1, 2});
    CHECK(Ratio{6, 3}.normalized() == Ratio{2, 1});
    CHECK(Ratio{0, 3}.normalized() == Ratio{1, 1});
    CHECK(Ratio{3, -1}.normalized() == Ratio{1, 1});
    CHECK(Ratio{3, 4}.value() == Approx(0.75));
    CHECK(Ratio{1, 0}.value() == 0.0);
}

TEST_CASE("Ratio bounding", "[dsp][core][transport_sync]") {
    CHECK(Ratio{6, 4}.bounded() == Ratio{3, 2});
    CHECK(Ratio{kMaxRatioTerm, 1}.bounded() == Ratio{kMaxRatioTerm, 1});
    CHECK(Ratio{kMaxRatioTerm + 1, 1}.bounded() == Ratio{kMaxRatioTerm, 1});
    CHECK(Ratio{1, 1000000}.bounded() == Ratio{1, kMaxRatioTerm});
    // Both terms clamped, then reduced
    CHECK(Ratio{4096 * 3, 4096}.bounded() == Ratio{3, 1});
    CHECK(Ratio{5000, 4999}.bounded() == Ratio{1, 1});
}

TEST_CASE("calculateTickStep counts cycles in exact units", "[dsp][core][transport_sync]") {
    SECTION("one bar (4 beats) at x1 takes 96 ticks") {
        const TickStep step = calculateTickStep({1, 1}, {4, 1});
        CHECK(step.unitsPerTick == 1);
        CHECK(step.unitsPerCycle == 96);
    }
    SECTION("x2 over one beat takes 12 ticks") {
        const TickStep step = calculateTickStep({2, 1}, {1, 1});
        CHECK(step.unitsPerTick == 1);
        CHECK(step.unitsPerCycle == 12);
    }
    SECTION("fractional beats stay exact") {
        // 1/3 beat per cycle -> 8 ticks
        const TickStep step = calculateTickStep({1, 1}, {1, 3});
        CHECK(step.unitsPerCycle / step.unitsPerTick == 8);
        CHECK(step.increment() == Approx(1.0 / 8.0));
    }
    SECTION("extreme ratios stay positive") {
        const TickStep step = calculateTickStep({1, 2147483647}, {2147483646, 1});
        CHECK(step.unitsPerTick == 1);
        CHECK(step.unitsPerCycle == int64_t{kMaxRatioTerm} * kMidiClockPpqn * kMaxRatioTerm);
        CHECK(step.increment() > 0.0);
    }
    SECTION("slow ratios keep integer units") {
        const TickStep step = calculateTickStep({1, 3}, {4, 1});
        CHECK(step.unitsPerTick == 1);
        CHECK(step.unitsPerCycle == 288);
    }
}

TEST_CASE("calculateTempoCycleFrequency", "[dsp][core][transport_sync]") {
    CHECK(calculateTempoCycleFrequency(120.0, {1, 1}, {1, 1}) == Approx(2.0));
    CHECK(calculateTempoCycleFrequency(120.0, {1, 1}, {4, 1}) == Approx(0.5));
    CHECK(calculateTempoCycleFrequency(90.0, {2, 1}, {1, 2}) == Approx(6.0));
    CHECK(calculateTempoCycleFrequency(0.0, {1, 1}, {1, 1}) == 0.0);
}

TEST_CASE("elektronCycleBeats maps SPD x MULT to beats per cycle", "[dsp][core][transport_sync]") {
    // 128 = one bar, so SPD 16 x MULT 8 = one bar = 4 beats
    CHECK(elektronCycleBeats(16, 8) == Ratio{4, 1});
    CHECK(elektronCycleBeats(16, 16) == Ratio{2, 1});
    CHECK(elektronCycleBeats(32, 64) == Ratio{1, 4});
    CHECK(elektronCycleBeats(1, 1) == Ratio{512, 1});
    CHECK(elektronCycleBeats(-16, 8) == Ratio{4, 1});
    CHECK(elektronCycleBeats(0, 8) == Ratio{1, 1});
}
