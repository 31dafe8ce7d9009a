// ==============================================================================
// Engine Settings Unit Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "parameters/engine_settings.h"

#include "public.sdk/source/common/memorystream.h"
#include "base/source/fstreamer.h"

#include <cstring>

using Catch::Approx;
using namespace Wtlfo;

TEST_CASE("EngineSettings defaults", "[engine_settings]") {
    const EngineSettings settings;
    CHECK(settings.receiveClock.load());
    CHECK(settings.receiveTransport.load());
    CHECK(settings.internalTempo.load() == 120.0f);
    CHECK(settings.minOutboundDelta.load() == DSP::kDefaultMinOutboundDelta);
    CHECK(settings.clockTimeout.load() == 2.0f);
    CHECK(settings.outlierRatio.load() == 0.0f);
}

TEST_CASE("Normalized conversions cover the documented ranges", "[engine_settings]") {
    CHECK(tempoFromNormalized(0.0) == 20.0f);
    CHECK(tempoFromNormalized(1.0) == 300.0f);
    CHECK(tempoFromNormalized(0.5) == Approx(160.0f));
    CHECK(tempoToNormalized(tempoFromNormalized(0.25)) == Approx(0.25));

    CHECK(minDeltaFromNormalized(1.0) == 8.0f);
    CHECK(smoothingFromNormalized(0.0) == Approx(0.01f));
    CHECK(timeoutFromNormalized(1.0) == 10.0f);

    CHECK(outlierRatioFromNormalized(0.0) == 0.0f);
    CHECK(outlierRatioFromNormalized(1.0) == Approx(4.0f));
}

TEST_CASE("handleEngineSettingChange stores denormalized values", "[engine_settings]") {
    EngineSettings settings;
    handleEngineSettingChange(settings, EngineSettingId::ReceiveClock, 0.0);
    handleEngineSettingChange(settings, EngineSettingId::InternalTempo, 0.5);
    handleEngineSettingChange(settings, EngineSettingId::ClockTimeout, 0.0);

    CHECK_FALSE(settings.receiveClock.load());
    CHECK(settings.internalTempo.load() == Approx(160.0f));
    CHECK(settings.clockTimeout.load() == Approx(0.25f));
}

TEST_CASE("formatEngineSetting", "[engine_settings]") {
    char text[64];
    REQUIRE(formatEngineSetting(EngineSettingId::ReceiveTransport, 1.0, text, sizeof(text)));
    CHECK(std::strcmp(text, "On") == 0);
    REQUIRE(formatEngineSetting(EngineSettingId::InternalTempo, 0.0, text, sizeof(text)));
    CHECK(std::strcmp(text, "20.0 BPM") == 0);
    REQUIRE(formatEngineSetting(EngineSettingId::ClockTimeout, 1.0, text, sizeof(text)));
    CHECK(std::strcmp(text, "10.00 s") == 0);
    REQUIRE(formatEngineSetting(EngineSettingId::OutlierRatio, 0.0, text, sizeof(text)));
    CHECK(std::strcmp(text, "Off") == 0);
}

TEST_CASE("toClockRecoveryConfig mirrors the settings", "[engine_settings]") {
    EngineSettings settings;
    settings.receiveTransport.store(false);
    settings.clockSmoothing.store(0.5f);
    settings.maxClockBpm.store(200.0f);

    const DSP::ClockRecoveryConfig config = toClockRecoveryConfig(settings);
    CHECK_FALSE(config.receiveTransport);
    CHECK(config.receiveClock);
    CHECK(config.smoothing == Approx(0.5));
    CHECK(config.maxBpm == Approx(200.0));
}

TEST_CASE("EngineSettings stream round trip", "[engine_settings][state]") {
    EngineSettings original;
    original.receiveClock.store(false);
    original.internalTempo.store(98.5f);
    original.minOutboundDelta.store(2.0f);
    original.outlierRatio.store(1.5f);

    Steinberg::MemoryStream stream;
    {
        Steinberg::IBStreamer writer(&stream, kLittleEndian);
        saveEngineSettings(original, writer);
    }
    stream.seek(0, Steinberg::IBStream::kIBSeekSet, nullptr);

    EngineSettings restored;
    Steinberg::IBStreamer reader(&stream, kLittleEndian);
    REQUIRE(loadEngineSettings(restored, reader));
    CHECK_FALSE(restored.receiveClock.load());
    CHECK(restored.internalTempo.load() == 98.5f);
    CHECK(restored.minOutboundDelta.load() == 2.0f);
    CHECK(restored.outlierRatio.load() == 1.5f);
}

TEST_CASE("loadEngineSettings rejects unknown versions and truncation", "[engine_settings][state]") {
    SECTION("future version") {
        Steinberg::MemoryStream stream;
        Steinberg::IBStreamer writer(&stream, kLittleEndian);
        writer.writeInt32(kEngineSettingsVersion + 1);
        stream.seek(0, Steinberg::IBStream::kIBSeekSet, nullptr);

        EngineSettings settings;
        Steinberg::IBStreamer reader(&stream, kLittleEndian);
        CHECK_FALSE(loadEngineSettings(settings, reader));
    }
    SECTION("empty stream") {
        Steinberg::MemoryStream stream;
        EngineSettings settings;
        Steinberg::IBStreamer reader(&stream, kLittleEndian);
        CHECK_FALSE(loadEngineSettings(settings, reader));
    }
}
