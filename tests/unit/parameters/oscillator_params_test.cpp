// ==============================================================================
// Oscillator Parameters Unit Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "parameters/oscillator_params.h"

#include "public.sdk/source/common/memorystream.h"
#include "base/source/fstreamer.h"

#include <cstring>

using Catch::Approx;
using namespace Wtlfo;

TEST_CASE("OscillatorConfig stream round trip", "[oscillator_params][state]") {
    DSP::OscillatorConfig config;
    config.waveform = DSP::Waveform::SmoothRandom;
    config.timebase = DSP::Timebase::ClockSync;
    config.speedMode = DSP::SpeedMode::TempoRelative;
    config.multiplier = {3, 2};
    config.beatsPerCycle = {1, 4};
    config.triggerMode = DSP::TriggerMode::HalfShot;
    config.depth = 42.0f;
    config.inverted = true;
    config.fadeIn = 3.0f;
    config.phaseOffset = 0.125;
    config.randomSeed = 0xDEADBEEF;

    Steinberg::MemoryStream stream;
    {
        Steinberg::IBStreamer writer(&stream, kLittleEndian);
        saveOscillatorConfig(config, writer);
    }
    stream.seek(0, Steinberg::IBStream::kIBSeekSet, nullptr);

    DSP::OscillatorConfig loaded;
    Steinberg::IBStreamer reader(&stream, kLittleEndian);
    REQUIRE(loadOscillatorConfig(loaded, reader));
    CHECK(loaded == config);
}

TEST_CASE("loadOscillatorConfig repairs invalid stored values", "[oscillator_params][state]") {
    Steinberg::MemoryStream stream;
    {
        Steinberg::IBStreamer writer(&stream, kLittleEndian);
        writer.writeInt32(300);      // waveform out of range
        writer.writeInt32(1);
        writer.writeInt32(0);
        writer.writeFloat(900.0f);   // speed above maximum
        writer.writeInt32(2);
        writer.writeInt32(4);
        writer.writeInt32(-1);       // invalid beats
        writer.writeInt32(1);
        writer.writeInt32(-7);       // trigger mode out of range
        writer.writeFloat(50.0f);
        writer.writeInt32(0);
        writer.writeFloat(0.0f);
        writer.writeDouble(2.5);
        writer.writeInt32u(1u);
    }
    stream.seek(0, Steinberg::IBStream::kIBSeekSet, nullptr);

    DSP::OscillatorConfig loaded;
    Steinberg::IBStreamer reader(&stream, kLittleEndian);
    REQUIRE(loadOscillatorConfig(loaded, reader));
    CHECK(loaded.waveform == DSP::Waveform::Sine);
    CHECK(loaded.timebase == DSP::Timebase::ClockSync);
    CHECK(loaded.speedHz == DSP::kMaxSpeedHz);
    CHECK(loaded.multiplier == DSP::Ratio{1, 2});
    CHECK(loaded.beatsPerCycle == DSP::Ratio{1, 1});
    CHECK(loaded.triggerMode == DSP::TriggerMode::Free);
    CHECK(loaded.phaseOffset == Approx(0.5));
}

TEST_CASE("loadOscillatorConfig fails on truncated data", "[oscillator_params][state]") {
    Steinberg::MemoryStream stream;
    {
        Steinberg::IBStreamer writer(&stream, kLittleEndian);
        writer.writeInt32(0);
        writer.writeInt32(0);
    }
    stream.seek(0, Steinberg::IBStream::kIBSeekSet, nullptr);

    DSP::OscillatorConfig loaded;
    loaded.depth = 12.0f;
    Steinberg::IBStreamer reader(&stream, kLittleEndian);
    CHECK_FALSE(loadOscillatorConfig(loaded, reader));
    CHECK(loaded.depth == 12.0f);
}

TEST_CASE("RoutingSet stream round trip", "[oscillator_params][state]") {
    DSP::RoutingSet routings;
    routings.assign(DSP::DestinationId::FilterFreq, 75.0f);
    routings.assign(DSP::DestinationId::Pan, 30.0f, 3);
    routings.setCenterOverride(DSP::DestinationId::Pan, -20.0f);

    Steinberg::MemoryStream stream;
    {
        Steinberg::IBStreamer writer(&stream, kLittleEndian);
        saveRoutingSet(routings, writer);
    }
    stream.seek(0, Steinberg::IBStream::kIBSeekSet, nullptr);

    DSP::RoutingSet loaded;
    Steinberg::IBStreamer reader(&stream, kLittleEndian);
    REQUIRE(loadRoutingSet(loaded, reader));
    CHECK(loaded == routings);
}

TEST_CASE("loadRoutingSet migrates legacy keys and drops unknown ones", "[oscillator_params][state]") {
    Steinberg::MemoryStream stream;
    {
        Steinberg::IBStreamer writer(&stream, kLittleEndian);
        writer.writeInt32(3);

        writer.writeStr8("filter_cutoff");
        writer.writeInt32(0);
        writer.writeFloat(60.0f);
        writer.writeInt32(0);
        writer.writeFloat(0.0f);

        writer.writeStr8("retired_destination");
        writer.writeInt32(0);
        writer.writeFloat(60.0f);
        writer.writeInt32(0);
        writer.writeFloat(0.0f);

        writer.writeStr8("volume");
        writer.writeInt32(99);   // no such oscillator
        writer.writeFloat(60.0f);
        writer.writeInt32(0);
        writer.writeFloat(0.0f);
    }
    stream.seek(0, Steinberg::IBStream::kIBSeekSet, nullptr);

    DSP::RoutingSet loaded;
    Steinberg::IBStreamer reader(&stream, kLittleEndian);
    REQUIRE(loadRoutingSet(loaded, reader));
    CHECK(loaded.size() == 1);
    REQUIRE(loaded.contains(DSP::DestinationId::FilterFreq));
    CHECK(loaded.find(DSP::DestinationId::FilterFreq)->amount == 60.0f);
}

TEST_CASE("Rate and fade formatting", "[oscillator_params][display]") {
    char text[64];
    DSP::OscillatorConfig config;
    config.speedHz = 2.5f;
    formatOscillatorRate(config, text, sizeof(text));
    CHECK(std::strcmp(text, "2.50 Hz") == 0);

    config.speedMode = DSP::SpeedMode::TempoRelative;
    config.multiplier = {2, 1};
    config.beatsPerCycle = {1, 1};
    formatOscillatorRate(config, text, sizeof(text));
    CHECK(std::strcmp(text, "x2 / 1 beat") == 0);

    config.multiplier = {1, 2};
    config.beatsPerCycle = {4, 1};
    formatOscillatorRate(config, text, sizeof(text));
    CHECK(std::strcmp(text, "x1/2 / 4 beats") == 0);

    formatFadeIn(config, text, sizeof(text));
    CHECK(std::strcmp(text, "Off") == 0);
    config.fadeIn = 1.5f;
    formatFadeIn(config, text, sizeof(text));
    CHECK(std::strcmp(text, "1.5 s") == 0);
    config.timebase = DSP::Timebase::ClockSync;
    config.fadeIn = 2.0f;
    formatFadeIn(config, text, sizeof(text));
    CHECK(std::strcmp(text, "2 cyc") == 0);
}
