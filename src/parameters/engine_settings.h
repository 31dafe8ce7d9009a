#pragma once

// ==============================================================================
// EngineSettings - Engine-wide configuration pack
// ==============================================================================
// Atomic settings shared between the control context (writes) and the ingest
// and scheduler contexts (reads). Relaxed ordering: each value is independent
// and picked up on the next ingest / process call.
// ==============================================================================

#include <wtlfo/dsp/primitives/clock_recovery.h>
#include <wtlfo/dsp/systems/modulation_router.h>

#include "base/source/fstreamer.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>

namespace Wtlfo {

/// Identifiers for normalized setting changes (UI sliders, remote control).
enum class EngineSettingId : uint8_t {
    ReceiveClock = 0,
    ReceiveTransport,
    InternalTempo,
    MinOutboundDelta,
    ClockSmoothing,
    MinClockBpm,
    MaxClockBpm,
    ClockTimeout,
    OutlierRatio
};

inline constexpr Steinberg::int32 kEngineSettingsVersion = 1;

struct EngineSettings {
    std::atomic<bool> receiveClock{true};
    std::atomic<bool> receiveTransport{true};
    std::atomic<float> internalTempo{120.0f};       // 20-300 BPM
    std::atomic<float> minOutboundDelta{DSP::kDefaultMinOutboundDelta};  // 0-8
    std::atomic<float> clockSmoothing{0.15f};       // 0.01-1
    std::atomic<float> minClockBpm{20.0f};          // 20-300
    std::atomic<float> maxClockBpm{300.0f};         // 20-300
    std::atomic<float> clockTimeout{2.0f};          // 0.25-10 s
    std::atomic<float> outlierRatio{0.0f};          // 0 = off, 1.1-4
};

// Linear: 0-1 -> 20-300 BPM
inline float tempoFromNormalized(double value) {
    return std::clamp(20.0f + static_cast<float>(value) * 280.0f, 20.0f, 300.0f);
}

inline double tempoToNormalized(float bpm) {
    return std::clamp(static_cast<double>((bpm - 20.0f) / 280.0f), 0.0, 1.0);
}

// Linear: 0-1 -> 0-8 (destination units)
inline float minDeltaFromNormalized(double value) {
    return std::clamp(static_cast<float>(value) * 8.0f, 0.0f, 8.0f);
}

// Linear: 0-1 -> 0.01-1
inline float smoothingFromNormalized(double value) {
    return std::clamp(0.01f + static_cast<float>(value) * 0.99f, 0.01f, 1.0f);
}

// Linear: 0-1 -> 0.25-10 s
inline float timeoutFromNormalized(double value) {
    return std::clamp(0.25f + static_cast<float>(value) * 9.75f, 0.25f, 10.0f);
}

// 0 = off, otherwise linear 1.1-4
inline float outlierRatioFromNormalized(double value) {
    if (value < 0.001) return 0.0f;
    return std::clamp(1.1f + static_cast<float>(value) * 2.9f, 1.1f, 4.0f);
}

inline void handleEngineSettingChange(
    EngineSettings& settings, EngineSettingId id, double value) {
    switch (id) {
        case EngineSettingId::ReceiveClock:
            settings.receiveClock.store(value >= 0.5, std::memory_order_relaxed); break;
        case EngineSettingId::ReceiveTransport:
            settings.receiveTransport.store(value >= 0.5, std::memory_order_relaxed); break;
        case EngineSettingId::InternalTempo:
            settings.internalTempo.store(tempoFromNormalized(value), std::memory_order_relaxed); break;
        case EngineSettingId::MinOutboundDelta:
            settings.minOutboundDelta.store(minDeltaFromNormalized(value), std::memory_order_relaxed); break;
        case EngineSettingId::ClockSmoothing:
            settings.clockSmoothing.store(smoothingFromNormalized(value), std::memory_order_relaxed); break;
        case EngineSettingId::MinClockBpm:
            settings.minClockBpm.store(tempoFromNormalized(value), std::memory_order_relaxed); break;
        case EngineSettingId::MaxClockBpm:
            settings.maxClockBpm.store(tempoFromNormalized(value), std::memory_order_relaxed); break;
        case EngineSettingId::ClockTimeout:
            settings.clockTimeout.store(timeoutFromNormalized(value), std::memory_order_relaxed); break;
        case EngineSettingId::OutlierRatio:
            settings.outlierRatio.store(outlierRatioFromNormalized(value), std::memory_order_relaxed); break;
    }
}

/// Format a normalized setting value for display. Returns false for unknown ids.
inline bool formatEngineSetting(
    EngineSettingId id, double value, char* text, size_t size) {
    switch (id) {
        case EngineSettingId::ReceiveClock:
        case EngineSettingId::ReceiveTransport:
            snprintf(text, size, "%s", value >= 0.5 ? "On" : "Off");
            return true;
        case EngineSettingId::InternalTempo:
        case EngineSettingId::MinClockBpm:
        case EngineSettingId::MaxClockBpm:
            snprintf(text, size, "%.1f BPM", tempoFromNormalized(value));
            return true;
        case EngineSettingId::MinOutboundDelta:
            snprintf(text, size, "%.2f", minDeltaFromNormalized(value));
            return true;
        case EngineSettingId::ClockSmoothing:
            snprintf(text, size, "%.2f", smoothingFromNormalized(value));
            return true;
        case EngineSettingId::ClockTimeout:
            snprintf(text, size, "%.2f s", timeoutFromNormalized(value));
            return true;
        case EngineSettingId::OutlierRatio: {
            float ratio = outlierRatioFromNormalized(value);
            if (ratio <= 0.0f) {
                snprintf(text, size, "Off");
            } else {
                snprintf(text, size, "x%.2f", ratio);
            }
            return true;
        }
    }
    return false;
}

/// Snapshot the clock-related settings for the clock recovery unit.
inline DSP::ClockRecoveryConfig toClockRecoveryConfig(const EngineSettings& settings) {
    DSP::ClockRecoveryConfig config;
    config.smoothing = settings.clockSmoothing.load(std::memory_order_relaxed);
    config.minBpm = settings.minClockBpm.load(std::memory_order_relaxed);
    config.maxBpm = settings.maxClockBpm.load(std::memory_order_relaxed);
    config.timeoutSeconds = settings.clockTimeout.load(std::memory_order_relaxed);
    config.outlierRatio = settings.outlierRatio.load(std::memory_order_relaxed);
    config.receiveClock = settings.receiveClock.load(std::memory_order_relaxed);
    config.receiveTransport = settings.receiveTransport.load(std::memory_order_relaxed);
    return config;
}

inline bool saveEngineSettings(const EngineSettings& settings, Steinberg::IBStreamer& streamer) {
    return streamer.writeInt32(kEngineSettingsVersion)
        && streamer.writeInt32(settings.receiveClock.load(std::memory_order_relaxed) ? 1 : 0)
        && streamer.writeInt32(settings.receiveTransport.load(std::memory_order_relaxed) ? 1 : 0)
        && streamer.writeFloat(settings.internalTempo.load(std::memory_order_relaxed))
        && streamer.writeFloat(settings.minOutboundDelta.load(std::memory_order_relaxed))
        && streamer.writeFloat(settings.clockSmoothing.load(std::memory_order_relaxed))
        && streamer.writeFloat(settings.minClockBpm.load(std::memory_order_relaxed))
        && streamer.writeFloat(settings.maxClockBpm.load(std::memory_order_relaxed))
        && streamer.writeFloat(settings.clockTimeout.load(std::memory_order_relaxed))
        && streamer.writeFloat(settings.outlierRatio.load(std::memory_order_relaxed));
}

inline bool loadEngineSettings(EngineSettings& settings, Steinberg::IBStreamer& streamer) {
    float fv = 0.0f; Steinberg::int32 iv = 0;
    if (!streamer.readInt32(iv)) { return false; }
    if (iv < 1 || iv > kEngineSettingsVersion) { return false; }
    if (!streamer.readInt32(iv)) { return false; } settings.receiveClock.store(iv != 0, std::memory_order_relaxed);
    if (!streamer.readInt32(iv)) { return false; } settings.receiveTransport.store(iv != 0, std::memory_order_relaxed);
    if (!streamer.readFloat(fv)) { return false; } settings.internalTempo.store(std::clamp(fv, 20.0f, 300.0f), std::memory_order_relaxed);
    if (!streamer.readFloat(fv)) { return false; } settings.minOutboundDelta.store(std::clamp(fv, 0.0f, 8.0f), std::memory_order_relaxed);
    if (!streamer.readFloat(fv)) { return false; } settings.clockSmoothing.store(std::clamp(fv, 0.01f, 1.0f), std::memory_order_relaxed);
    if (!streamer.readFloat(fv)) { return false; } settings.minClockBpm.store(std::clamp(fv, 20.0f, 300.0f), std::memory_order_relaxed);
    if (!streamer.readFloat(fv)) { return false; } settings.maxClockBpm.store(std::clamp(fv, 20.0f, 300.0f), std::memory_order_relaxed);
    if (!streamer.readFloat(fv)) { return false; } settings.clockTimeout.store(std::clamp(fv, 0.25f, 10.0f), std::memory_order_relaxed);
    if (!streamer.readFloat(fv)) { return false; } settings.outlierRatio.store(fv > 1.0f ? std::min(fv, 4.0f) : 0.0f, std::memory_order_relaxed);
    return true;
}

} // namespace Wtlfo
