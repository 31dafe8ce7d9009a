// ==============================================================================
// Factory Presets Unit Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "preset/factory_presets.h"

#include <string>

using Catch::Approx;
using namespace Wtlfo;

TEST_CASE("Factory preset list", "[factory_presets]") {
    const auto presets = factoryPresets();
    REQUIRE(presets.size() == 6);
    CHECK(presets[0].name == "Init");
    CHECK(presets[1].name == "Wobble Bass");
    CHECK(presets[5].name == "Fade-In One-Shot");

    for (const auto& preset : presets) {
        INFO(preset.name);
        CHECK(PresetStore::isValidPresetName(preset.name));
        CHECK(DSP::sanitize(preset.config) == preset.config);
        CHECK(preset.routings.size() == 1);
    }
}

TEST_CASE("fromElektronSettings converts SPD x MULT to beats per cycle", "[factory_presets]") {
    ElektronLfoSettings settings;
    settings.speed = 16;
    settings.multiplier = 8;
    const DSP::OscillatorConfig config = fromElektronSettings(settings);
    CHECK(config.timebase == DSP::Timebase::Free);
    CHECK(config.speedMode == DSP::SpeedMode::TempoRelative);
    CHECK(config.beatsPerCycle == DSP::Ratio{4, 1});
    CHECK(config.depth == Approx(100.0f));
    CHECK_FALSE(config.inverted);
}

TEST_CASE("fromElektronSettings maps depth, polarity, start phase and fade", "[factory_presets]") {
    ElektronLfoSettings settings;
    settings.depth = -32;
    settings.startPhase = 64;
    settings.speed = 8;
    settings.multiplier = 16;
    settings.fade = -16;

    const DSP::OscillatorConfig config = fromElektronSettings(settings);
    CHECK(config.inverted);
    CHECK(config.depth == Approx(32.0f / 63.0f * 100.0f));
    CHECK(config.phaseOffset == Approx(0.5));
    // Half a cycle of a 4-beat cycle at 120 BPM
    CHECK(config.fadeIn == Approx(1.0f));

    SECTION("negative speed flips the polarity") {
        settings.speed = -8;
        CHECK_FALSE(fromElektronSettings(settings).inverted);
    }

    SECTION("positive fade (fade-out) is ignored") {
        settings.fade = 20;
        CHECK(fromElektronSettings(settings).fadeIn == 0.0f);
    }
}

TEST_CASE("Factory preset details", "[factory_presets]") {
    const auto presets = factoryPresets();

    const auto& wobble = presets[1];
    CHECK(wobble.config.triggerMode == DSP::TriggerMode::Trigger);
    CHECK(wobble.config.phaseOffset == Approx(0.25));
    CHECK(wobble.routings.contains(DSP::DestinationId::FilterFreq));

    const auto& pumping = presets[4];
    CHECK(pumping.config.inverted);
    CHECK(pumping.config.waveform == DSP::Waveform::Exponential);
    CHECK(pumping.routings.contains(DSP::DestinationId::Volume));

    const auto& oneShot = presets[5];
    CHECK(oneShot.config.triggerMode == DSP::TriggerMode::OneShot);
    CHECK(oneShot.config.fadeIn == Approx(2.0f));
}

TEST_CASE("installFactoryPresets skips names already present", "[factory_presets]") {
    PresetStore store;
    REQUIRE(store.save("Init", DSP::OscillatorConfig{}, {}) == PresetError::None);

    CHECK(installFactoryPresets(store) == 5);
    CHECK(store.size() == 6);
    CHECK(installFactoryPresets(store) == 0);
    CHECK(store.size() == 6);
}
