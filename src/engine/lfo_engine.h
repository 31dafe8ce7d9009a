#pragma once

// ==============================================================================
// LfoEngine - Clock recovery, oscillators and routing in one place
// ==============================================================================
// Three contexts call into the engine:
//
//   Ingest     ingest(), ingestMidiByte(), setConnectionState()
//              Single writer of the recovered clock state.
//   Scheduler  process(now). Owns the oscillator voices and the outbound
//              delta filter, and calls the ParameterSink.
//   Control    enable(), disable(), retrigger(), publishPatch(), loadPreset(),
//              settings() and every snapshot accessor.
//
// The live patch is an immutable ModulationPatch behind an atomic
// shared_ptr: a publication is seen by process() either completely or not at
// all. Clock state and per-oscillator / per-destination snapshots are
// published through sequence-locked cells, so readers never see torn values.
//
// Constitution Compliance:
// - Principle II: process() and ingest() never block, never allocate
// ==============================================================================

#include "engine/modulation_patch.h"
#include "engine/parameter_sink.h"
#include "parameters/engine_settings.h"
#include "preset/preset_store.h"

#include <wtlfo/dsp/core/clock_state.h>
#include <wtlfo/dsp/core/snapshot_cell.h>
#include <wtlfo/dsp/primitives/clock_recovery.h>
#include <wtlfo/dsp/primitives/lfo.h>
#include <wtlfo/dsp/primitives/phase_engine.h>
#include <wtlfo/dsp/systems/modulation_router.h>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace Wtlfo {

/// Pull snapshot of one oscillator voice.
struct OscillatorSnapshot {
    bool active = false;
    DSP::PhaseEngineState state = DSP::PhaseEngineState::Stopped;
    float sample = 0.0f;      ///< Shape output [-1, 1]
    float fadeGain = 1.0f;
    double phase = 0.0;
};

/// Pull snapshot of the values most recently resolved per destination.
struct OutboundSnapshot {
    std::array<float, DSP::kDestinationSlotCount> values{};
    std::array<bool, DSP::kDestinationSlotCount> valid{};
};

class LfoEngine {
public:
    /// @param sink Receives outbound updates; may be null (snapshots only).
    ///        Not owned; must outlive the engine.
    explicit LfoEngine(ParameterSink* sink = nullptr);
    ~LfoEngine();

    LfoEngine(const LfoEngine&) = delete;
    LfoEngine& operator=(const LfoEngine&) = delete;

    // ==========================================================================
    // Ingest context
    // ==========================================================================

    /// Feed a decoded clock / transport event. Returns false if dropped.
    bool ingest(const DSP::ClockEvent& event) noexcept;

    /// Feed a raw MIDI status byte. Non-realtime and irrelevant bytes are
    /// dropped (returns false).
    bool ingestMidiByte(uint8_t status, double timestamp) noexcept;

    /// Report link state. Losing the connection or the device resets the
    /// clock and forces every destination to be re-sent after reconnection.
    void setConnectionState(const ConnectionState& state) noexcept;

    // ==========================================================================
    // Scheduler context
    // ==========================================================================

    /// Advance all oscillators to time `now` (seconds, same clock as the
    /// ingest timestamps) and emit changed destination values.
    void process(double now) noexcept;

    // ==========================================================================
    // Control context
    // ==========================================================================

    /// Start the oscillators from the beginning of their cycles.
    void enable() noexcept;

    /// Stop all oscillators. No phase advance happens in any process() call
    /// that starts after this returns.
    void disable() noexcept;

    [[nodiscard]] bool isEnabled() const noexcept;

    /// Request an explicit retrigger of one oscillator on the next process().
    void retrigger(DSP::LfoId id) noexcept;

    /// Publish a new live patch in one step. Returns the assigned revision.
    uint64_t publishPatch(ModulationPatch patch);

    /// Replace one oscillator's configuration (copy, modify, publish).
    uint64_t updateOscillator(DSP::LfoId id, const DSP::OscillatorConfig& config);

    /// Replace the routing set (copy, modify, publish).
    uint64_t updateRoutings(const DSP::RoutingSet& routings);

    /// Build a patch from a stored preset and publish it.
    PresetError loadPreset(PresetStore& store, size_t index);

    [[nodiscard]] std::shared_ptr<const ModulationPatch> livePatch() const;

    [[nodiscard]] EngineSettings& settings() noexcept { return settings_; }
    [[nodiscard]] const EngineSettings& settings() const noexcept { return settings_; }

    // ==========================================================================
    // Snapshots (any thread)
    // ==========================================================================

    /// Clock state as seen at `now`, silence timeout applied.
    [[nodiscard]] DSP::ClockState clockState(double now) const noexcept;

    /// Display tempo (snapped), or 0 when unknown.
    [[nodiscard]] double displayTempo(double now) const noexcept;

    [[nodiscard]] ConnectionState connectionState() const noexcept;

    [[nodiscard]] OscillatorSnapshot oscillatorSnapshot(DSP::LfoId id) const noexcept;

    /// Latest resolved value of a destination. Returns false if the
    /// destination is not routed or nothing was resolved yet.
    [[nodiscard]] bool outboundValue(DSP::DestinationId destination, float& value) const noexcept;

    [[nodiscard]] OutboundSnapshot outboundSnapshot() const noexcept;

    /// Number of updates handed to the sink since construction.
    [[nodiscard]] uint64_t emittedUpdateCount() const noexcept;

private:
    void applyPatch(const ModulationPatch& patch) noexcept;
    void traceTransport(const DSP::ClockState& clock) noexcept;

    static constexpr uint8_t kConnectedBit = 0x01;
    static constexpr uint8_t kDeviceAvailableBit = 0x02;

    ParameterSink* sink_ = nullptr;
    EngineSettings settings_;

    // Ingest context
    DSP::ClockRecovery clock_;
    std::atomic<uint8_t> connection_{0};

    // Control -> scheduler
    std::atomic<bool> enabled_{false};
    std::atomic<uint32_t> retriggerMask_{0};
    std::atomic<bool> outboundResetRequested_{false};
    std::atomic<std::shared_ptr<const ModulationPatch>> live_;
    std::atomic<uint64_t> nextRevision_{1};

    // Scheduler context
    std::array<DSP::LFO, DSP::kMaxOscillators> lfos_;
    std::array<bool, DSP::kMaxOscillators> lfoActive_{};
    DSP::OutboundValueFilter filter_;
    DSP::RoutingSet appliedRoutings_;
    OutboundSnapshot outboundWorking_{};
    uint64_t appliedRevision_ = 0;
    bool running_ = false;
    bool hasProcessed_ = false;
    double lastProcessTime_ = 0.0;
    uint32_t tracedEpoch_ = 0;
    bool tracedRunning_ = false;

    // Scheduler -> readers
    std::array<DSP::SnapshotCell<OscillatorSnapshot>, DSP::kMaxOscillators> oscillatorCells_;
    DSP::SnapshotCell<OutboundSnapshot> outboundCell_;
    std::atomic<uint64_t> emittedCount_{0};
};

} // namespace Wtlfo
