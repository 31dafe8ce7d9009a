#include "factory_presets.h"

#include <wtlfo/dsp/core/destination_registry.h>
#include <wtlfo/dsp/core/transport_sync.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace Wtlfo {

namespace {

// FADE magnitude per cycle of fade-in
constexpr double kFadeUnitsPerCycle = 32.0;

struct FactoryEntry {
    const char* name;
    ElektronLfoSettings settings;
    DSP::DestinationId destination;
};

// clang-format off
const FactoryEntry kFactoryEntries[] = {
    {"Init",              {DSP::Waveform::Sine,        16, 16,  0, DSP::TriggerMode::Free,     63,   0}, DSP::DestinationId::FilterFreq},
    {"Wobble Bass",       {DSP::Waveform::Sine,        16,  8, 32, DSP::TriggerMode::Trigger,  48,   0}, DSP::DestinationId::FilterFreq},
    {"Ambient Drift",     {DSP::Waveform::Sine,         1,  1,  0, DSP::TriggerMode::Free,     24,   0}, DSP::DestinationId::Pan},
    {"Hi-Hat Humanizer",  {DSP::Waveform::SampleHold,  32, 64,  0, DSP::TriggerMode::Free,     12,   0}, DSP::DestinationId::Volume},
    {"Pumping Sidechain", {DSP::Waveform::Exponential, 32,  4,  0, DSP::TriggerMode::Trigger, -63,   0}, DSP::DestinationId::Volume},
    {"Fade-In One-Shot",  {DSP::Waveform::Ramp,         8, 16,  0, DSP::TriggerMode::OneShot,  63, -32}, DSP::DestinationId::FilterFreq},
};
// clang-format on

} // namespace

DSP::OscillatorConfig fromElektronSettings(const ElektronLfoSettings& settings) {
    DSP::OscillatorConfig config;
    config.waveform = settings.waveform;
    config.timebase = DSP::Timebase::Free;
    config.speedMode = DSP::SpeedMode::TempoRelative;
    config.multiplier = DSP::Ratio{1, 1};
    config.beatsPerCycle = DSP::elektronCycleBeats(settings.speed, settings.multiplier);
    config.triggerMode = settings.mode;

    const int depth = std::clamp(settings.depth, -64, 63);
    config.depth = std::min(100.0f, static_cast<float>(std::abs(depth)) / 63.0f * 100.0f);
    config.inverted = depth < 0;
    // Negative speed runs the cycle backwards, which is the same as inverting
    // a symmetric wave; fold it into the polarity
    if (settings.speed < 0) {
        config.inverted = !config.inverted;
    }

    config.phaseOffset = static_cast<double>(std::clamp(settings.startPhase, 0, 127)) / 128.0;

    if (settings.fade < 0) {
        const double cycles = static_cast<double>(-settings.fade) / kFadeUnitsPerCycle;
        const double cycleSeconds = config.beatsPerCycle.value() * 60.0 / kFactoryReferenceBpm;
        config.fadeIn = static_cast<float>(cycles * cycleSeconds);
    }
    return DSP::sanitize(config);
}

std::vector<Preset> factoryPresets() {
    std::vector<Preset> presets;
    for (const auto& entry : kFactoryEntries) {
        Preset preset;
        preset.name = entry.name;
        preset.config = fromElektronSettings(entry.settings);
        preset.routings.assign(entry.destination, DSP::kMaxRoutingAmount);
        presets.push_back(std::move(preset));
    }
    return presets;
}

size_t installFactoryPresets(PresetStore& store) {
    size_t added = 0;
    for (const auto& preset : factoryPresets()) {
        if (store.save(preset.name, preset.config, preset.routings) == PresetError::None) {
            ++added;
        }
    }
    return added;
}

} // namespace Wtlfo
