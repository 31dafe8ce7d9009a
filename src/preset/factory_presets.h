#pragma once

// ==============================================================================
// Factory Presets
// ==============================================================================
// Built-in presets, authored in Elektron LFO terms (SPD, MULT, SPH, MODE,
// DEP, FADE) and converted to OscillatorConfig values.
// ==============================================================================

#include "preset_store.h"

#include <wtlfo/dsp/core/oscillator_config.h>

#include <cstddef>
#include <vector>

namespace Wtlfo {

/// Reference tempo the Elektron fade amount is converted at.
inline constexpr double kFactoryReferenceBpm = 120.0;

/// LFO settings as shown on an Elektron device page.
struct ElektronLfoSettings {
    DSP::Waveform waveform = DSP::Waveform::Sine;
    int speed = 16;           ///< SPD -64..63
    int multiplier = 16;      ///< MULT 1..2048
    int startPhase = 0;       ///< SPH 0..127
    DSP::TriggerMode mode = DSP::TriggerMode::Free;
    int depth = 63;           ///< DEP -64..63, negative inverts
    int fade = 0;             ///< FADE -64..63, negative fades in
};

/// Convert device-page settings to an oscillator configuration.
///
/// The result runs on the free timebase with a tempo-relative rate, so it
/// follows the received clock tempo and falls back to the internal tempo.
/// Only fade-in (negative FADE) is supported; fade-out is ignored.
DSP::OscillatorConfig fromElektronSettings(const ElektronLfoSettings& settings);

/// All factory presets, in display order.
std::vector<Preset> factoryPresets();

/// Append the factory presets that are not already present by name.
/// @return Number of presets added
size_t installFactoryPresets(PresetStore& store);

} // namespace Wtlfo
