#pragma once

// ==============================================================================
// Oscillator / Routing stream serialization and display formatting
// ==============================================================================
// Field order is part of the preset stream format. Destinations are written
// by stable key, so renamed destinations can be migrated on load.
// ==============================================================================

#include <wtlfo/dsp/core/destination_registry.h>
#include <wtlfo/dsp/core/oscillator_config.h>
#include <wtlfo/dsp/systems/modulation_router.h>

#include "base/source/fstreamer.h"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

namespace Wtlfo {

// Raw enum values outside uint8_t map to 0xFF, which sanitize() replaces
// with the default instead of accepting a truncated value
inline uint8_t enumByte(Steinberg::int32 value) {
    return (value < 0 || value > 0xFF) ? uint8_t{0xFF} : static_cast<uint8_t>(value);
}

/// Write a configuration. Returns false as soon as a write fails.
inline bool saveOscillatorConfig(const DSP::OscillatorConfig& config, Steinberg::IBStreamer& streamer) {
    return streamer.writeInt32(static_cast<Steinberg::int32>(config.waveform))
        && streamer.writeInt32(static_cast<Steinberg::int32>(config.timebase))
        && streamer.writeInt32(static_cast<Steinberg::int32>(config.speedMode))
        && streamer.writeFloat(config.speedHz)
        && streamer.writeInt32(config.multiplier.numerator)
        && streamer.writeInt32(config.multiplier.denominator)
        && streamer.writeInt32(config.beatsPerCycle.numerator)
        && streamer.writeInt32(config.beatsPerCycle.denominator)
        && streamer.writeInt32(static_cast<Steinberg::int32>(config.triggerMode))
        && streamer.writeFloat(config.depth)
        && streamer.writeInt32(config.inverted ? 1 : 0)
        && streamer.writeFloat(config.fadeIn)
        && streamer.writeDouble(config.phaseOffset)
        && streamer.writeInt32u(config.randomSeed);
}

/// Read a configuration. Out-of-range values are repaired with sanitize().
inline bool loadOscillatorConfig(DSP::OscillatorConfig& config, Steinberg::IBStreamer& streamer) {
    DSP::OscillatorConfig loaded;
    float fv = 0.0f; double dv = 0.0; Steinberg::int32 iv = 0; Steinberg::uint32 uv = 0;
    if (!streamer.readInt32(iv)) { return false; } loaded.waveform = static_cast<DSP::Waveform>(enumByte(iv));
    if (!streamer.readInt32(iv)) { return false; } loaded.timebase = static_cast<DSP::Timebase>(enumByte(iv));
    if (!streamer.readInt32(iv)) { return false; } loaded.speedMode = static_cast<DSP::SpeedMode>(enumByte(iv));
    if (!streamer.readFloat(fv)) { return false; } loaded.speedHz = fv;
    if (!streamer.readInt32(iv)) { return false; } loaded.multiplier.numerator = iv;
    if (!streamer.readInt32(iv)) { return false; } loaded.multiplier.denominator = iv;
    if (!streamer.readInt32(iv)) { return false; } loaded.beatsPerCycle.numerator = iv;
    if (!streamer.readInt32(iv)) { return false; } loaded.beatsPerCycle.denominator = iv;
    if (!streamer.readInt32(iv)) { return false; } loaded.triggerMode = static_cast<DSP::TriggerMode>(enumByte(iv));
    if (!streamer.readFloat(fv)) { return false; } loaded.depth = fv;
    if (!streamer.readInt32(iv)) { return false; } loaded.inverted = iv != 0;
    if (!streamer.readFloat(fv)) { return false; } loaded.fadeIn = fv;
    if (!streamer.readDouble(dv)) { return false; } loaded.phaseOffset = dv;
    if (!streamer.readInt32u(uv)) { return false; } loaded.randomSeed = uv;

    config = DSP::sanitize(loaded);
    return true;
}

/// Read a length-prefixed string written with writeStr8().
inline bool readString(Steinberg::IBStreamer& streamer, std::string& out) {
    std::unique_ptr<Steinberg::char8[]> raw(streamer.readStr8());
    if (!raw) {
        return false;
    }
    out = raw.get();
    return true;
}

inline bool saveRoutingSet(const DSP::RoutingSet& routings, Steinberg::IBStreamer& streamer) {
    bool ok = streamer.writeInt32(static_cast<Steinberg::int32>(routings.size()));
    routings.forEach([&streamer, &ok](const DSP::Routing& routing) {
        if (!ok) {
            return;
        }
        const std::string key(DSP::destinationKey(routing.destination));
        ok = streamer.writeStr8(key.c_str())
            && streamer.writeInt32(routing.lfo)
            && streamer.writeFloat(routing.amount)
            && streamer.writeInt32(routing.hasCenterOverride ? 1 : 0)
            && streamer.writeFloat(routing.centerOverride);
    });
    return ok;
}

/// Read a routing set. Routings whose key no longer names a destination are
/// dropped; legacy keys are migrated.
inline bool loadRoutingSet(DSP::RoutingSet& routings, Steinberg::IBStreamer& streamer) {
    Steinberg::int32 count = 0;
    if (!streamer.readInt32(count)) { return false; }
    if (count < 0 || count > static_cast<Steinberg::int32>(DSP::kDestinationCount)) { return false; }

    DSP::RoutingSet loaded;
    for (Steinberg::int32 i = 0; i < count; ++i) {
        std::string key;
        float amount = 0.0f; float center = 0.0f;
        Steinberg::int32 lfo = 0; Steinberg::int32 hasCenter = 0;
        if (!readString(streamer, key)) { return false; }
        if (!streamer.readInt32(lfo)) { return false; }
        if (!streamer.readFloat(amount)) { return false; }
        if (!streamer.readInt32(hasCenter)) { return false; }
        if (!streamer.readFloat(center)) { return false; }

        const DSP::DestinationId destination = DSP::destinationFromKey(key);
        if (destination == DSP::DestinationId::None ||
            lfo < 0 || lfo >= static_cast<Steinberg::int32>(DSP::kMaxOscillators)) {
            continue;
        }

        DSP::Routing routing;
        routing.lfo = static_cast<DSP::LfoId>(lfo);
        routing.destination = destination;
        routing.amount = amount;
        routing.hasCenterOverride = hasCenter != 0;
        routing.centerOverride = hasCenter != 0 ? center : 0.0f;
        loaded.assign(routing);
    }
    routings = loaded;
    return true;
}

// ==============================================================================
// Display formatting
// ==============================================================================

/// "1/4" or "2" style ratio text.
inline void formatRatio(DSP::Ratio ratio, char* text, size_t size) {
    const DSP::Ratio r = ratio.normalized();
    if (r.denominator == 1) {
        snprintf(text, size, "%d", static_cast<int>(r.numerator));
    } else {
        snprintf(text, size, "%d/%d", static_cast<int>(r.numerator), static_cast<int>(r.denominator));
    }
}

/// Rate text: "2.50 Hz" for hertz rates, "x2 / 4 beats" for tempo rates.
inline void formatOscillatorRate(const DSP::OscillatorConfig& config, char* text, size_t size) {
    if (config.timebase == DSP::Timebase::Free && config.speedMode == DSP::SpeedMode::Hertz) {
        snprintf(text, size, "%.2f Hz", static_cast<double>(config.speedHz));
        return;
    }
    char multiplier[24];
    char beats[24];
    formatRatio(config.multiplier, multiplier, sizeof(multiplier));
    formatRatio(config.beatsPerCycle, beats, sizeof(beats));
    const bool single = config.beatsPerCycle.normalized() == DSP::Ratio{1, 1};
    snprintf(text, size, "x%s / %s %s", multiplier, beats, single ? "beat" : "beats");
}

/// Fade-in text in the unit of the timebase ("Off", "1.5 s", "2 cyc").
inline void formatFadeIn(const DSP::OscillatorConfig& config, char* text, size_t size) {
    if (config.fadeIn <= 0.0f) {
        snprintf(text, size, "Off");
    } else if (config.timebase == DSP::Timebase::ClockSync) {
        snprintf(text, size, "%g cyc", static_cast<double>(config.fadeIn));
    } else {
        snprintf(text, size, "%.1f s", static_cast<double>(config.fadeIn));
    }
}

} // namespace Wtlfo
