#include "lfo_engine.h"

#include <wtlfo/dsp/core/midi_utils.h>

#include <cmath>
#include <utility>

// Transport and patch tracing
#define WTLFO_ENGINE_DEBUG 0
#if WTLFO_ENGINE_DEBUG
#include <cstdarg>
#include <cstdio>
static inline void logEngine(const char* fmt, ...) {
    char buf[256];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    fprintf(stderr, "%s", buf);
}
#endif

namespace Wtlfo {

LfoEngine::LfoEngine(ParameterSink* sink)
    : sink_(sink) {
    clock_.setConfig(toClockRecoveryConfig(settings_));
    filter_.setMinDelta(settings_.minOutboundDelta.load(std::memory_order_relaxed));
    live_.store(std::make_shared<const ModulationPatch>(), std::memory_order_release);
}

LfoEngine::~LfoEngine() = default;

// ==============================================================================
// Ingest context
// ==============================================================================

bool LfoEngine::ingest(const DSP::ClockEvent& event) noexcept {
    clock_.setConfig(toClockRecoveryConfig(settings_));
    return clock_.ingest(event);
}

bool LfoEngine::ingestMidiByte(uint8_t status, double timestamp) noexcept {
    if (!DSP::isClockRelevantStatus(status)) {
        return false;
    }
    clock_.setConfig(toClockRecoveryConfig(settings_));
    return clock_.ingestStatusByte(status, timestamp);
}

void LfoEngine::setConnectionState(const ConnectionState& state) noexcept {
    uint8_t bits = 0;
    if (state.connected) bits |= kConnectedBit;
    if (state.deviceAvailable) bits |= kDeviceAvailableBit;

    const uint8_t previous = connection_.exchange(bits, std::memory_order_acq_rel);
    if (previous == bits) {
        return;
    }

    if (!state.isUsable()) {
        clock_.reset();
        outboundResetRequested_.store(true, std::memory_order_release);
#if WTLFO_ENGINE_DEBUG
        logEngine("[wtlfo] link lost (connected=%d device=%d), clock reset\n",
                  state.connected ? 1 : 0, state.deviceAvailable ? 1 : 0);
#endif
    }
}

// ==============================================================================
// Scheduler context
// ==============================================================================

void LfoEngine::process(double now) noexcept {
    if (!std::isfinite(now)) {
        return;
    }

    double elapsed = hasProcessed_ ? now - lastProcessTime_ : 0.0;
    if (!(elapsed > 0.0)) {
        elapsed = 0.0;
    }
    lastProcessTime_ = now;
    hasProcessed_ = true;

    if (!enabled_.load(std::memory_order_acquire)) {
        if (running_) {
            for (auto& lfo : lfos_) {
                lfo.disable();
            }
            running_ = false;
        }
        return;
    }

    const auto patch = live_.load(std::memory_order_acquire);
    if (patch->revision != appliedRevision_) {
        applyPatch(*patch);
    }

    const float tempo = settings_.internalTempo.load(std::memory_order_relaxed);
    for (auto& lfo : lfos_) {
        lfo.setInternalTempo(static_cast<double>(tempo));
    }

    if (!running_) {
        for (size_t i = 0; i < lfos_.size(); ++i) {
            if (lfoActive_[i]) {
                lfos_[i].enable();
            }
        }
        running_ = true;
    }

    filter_.setMinDelta(settings_.minOutboundDelta.load(std::memory_order_relaxed));
    if (outboundResetRequested_.exchange(false, std::memory_order_acq_rel)) {
        filter_.reset();
    }

    const uint32_t retriggers = retriggerMask_.exchange(0, std::memory_order_acq_rel);
    for (size_t i = 0; i < lfos_.size(); ++i) {
        if ((retriggers & (1u << i)) != 0 && lfoActive_[i]) {
            lfos_[i].retrigger();
        }
    }

    const DSP::ClockState clock = clock_.currentState(now);
    traceTransport(clock);

    std::array<DSP::LfoOutput, DSP::kMaxOscillators> outputs{};
    for (size_t i = 0; i < lfos_.size(); ++i) {
        if (!lfoActive_[i]) {
            continue;
        }
        outputs[i] = lfos_[i].process(elapsed, clock);

        OscillatorSnapshot snapshot;
        snapshot.active = true;
        snapshot.state = lfos_[i].phaseEngine().state();
        snapshot.sample = outputs[i].sample;
        snapshot.fadeGain = outputs[i].fadeGain;
        snapshot.phase = outputs[i].phase;
        oscillatorCells_[i].publish(snapshot);
    }

    const uint8_t link = connection_.load(std::memory_order_acquire);
    const bool usable = (link & kConnectedBit) != 0 && (link & kDeviceAvailableBit) != 0;

    patch->routings.forEach([&](const DSP::Routing& routing) {
        if (routing.lfo >= lfos_.size() || !lfoActive_[routing.lfo]) {
            return;
        }
        const auto* def = DSP::getDestination(routing.destination);
        if (def == nullptr) {
            return;
        }
        const float depth = patch->oscillators[routing.lfo].config.depth;
        const float value =
            DSP::resolveModulation(outputs[routing.lfo].modulation(), depth, routing, *def);

        const size_t index = DSP::destinationIndex(routing.destination);
        outboundWorking_.values[index] = value;
        outboundWorking_.valid[index] = true;

        if (usable && sink_ != nullptr && filter_.shouldEmit(routing.destination, value)) {
            sink_->sendParameterUpdate(routing.destination, value);
            emittedCount_.fetch_add(1, std::memory_order_relaxed);
        }
    });
    outboundCell_.publish(outboundWorking_);
}

void LfoEngine::applyPatch(const ModulationPatch& patch) noexcept {
    for (size_t i = 0; i < lfos_.size(); ++i) {
        const auto& slot = patch.oscillators[i];
        if (slot.active) {
            lfos_[i].configure(slot.config);
            if (!lfoActive_[i]) {
                lfoActive_[i] = true;
                if (running_) {
                    lfos_[i].enable();
                }
            }
        } else if (lfoActive_[i]) {
            lfos_[i].disable();
            lfoActive_[i] = false;
            oscillatorCells_[i].publish(OscillatorSnapshot{});
        }
    }

    // Routes that went away stop reporting and are re-sent if they come back
    appliedRoutings_.forEach([&](const DSP::Routing& routing) {
        if (!patch.routings.contains(routing.destination)) {
            filter_.reset(routing.destination);
            const size_t index = DSP::destinationIndex(routing.destination);
            outboundWorking_.values[index] = 0.0f;
            outboundWorking_.valid[index] = false;
        }
    });
    appliedRoutings_ = patch.routings;
    appliedRevision_ = patch.revision;

#if WTLFO_ENGINE_DEBUG
    logEngine("[wtlfo] applied patch rev %llu (%zu oscillators, %zu routes)\n",
              static_cast<unsigned long long>(patch.revision),
              patch.activeOscillatorCount(), patch.routings.size());
#endif
}

void LfoEngine::traceTransport(const DSP::ClockState& clock) noexcept {
#if WTLFO_ENGINE_DEBUG
    if (clock.transportEpoch != tracedEpoch_) {
        logEngine("[wtlfo] transport %s (epoch %u, pos %llu)\n",
                  clock.lastTransportEvent == DSP::TransportEvent::Start ? "start" : "continue",
                  static_cast<unsigned>(clock.transportEpoch),
                  static_cast<unsigned long long>(clock.songPositionTicks));
    } else if (tracedRunning_ && !clock.running) {
        logEngine("[wtlfo] transport stopped\n");
    }
#endif
    tracedEpoch_ = clock.transportEpoch;
    tracedRunning_ = clock.running;
}

// ==============================================================================
// Control context
// ==============================================================================

void LfoEngine::enable() noexcept {
    enabled_.store(true, std::memory_order_release);
}

void LfoEngine::disable() noexcept {
    enabled_.store(false, std::memory_order_release);
}

bool LfoEngine::isEnabled() const noexcept {
    return enabled_.load(std::memory_order_acquire);
}

void LfoEngine::retrigger(DSP::LfoId id) noexcept {
    if (id < DSP::kMaxOscillators) {
        retriggerMask_.fetch_or(1u << id, std::memory_order_acq_rel);
    }
}

uint64_t LfoEngine::publishPatch(ModulationPatch patch) {
    patch.revision = nextRevision_.fetch_add(1, std::memory_order_relaxed);
    const uint64_t revision = patch.revision;
    live_.store(std::make_shared<const ModulationPatch>(std::move(patch)),
                std::memory_order_release);
    return revision;
}

uint64_t LfoEngine::updateOscillator(DSP::LfoId id, const DSP::OscillatorConfig& config) {
    ModulationPatch patch = *livePatch();
    patch.setOscillator(id, DSP::sanitize(config));
    return publishPatch(std::move(patch));
}

uint64_t LfoEngine::updateRoutings(const DSP::RoutingSet& routings) {
    ModulationPatch patch = *livePatch();
    patch.routings = routings;
    return publishPatch(std::move(patch));
}

PresetError LfoEngine::loadPreset(PresetStore& store, size_t index) {
    DSP::OscillatorConfig config;
    DSP::RoutingSet routings;
    const PresetError error = store.load(index, config, routings);
    if (error != PresetError::None) {
        return error;
    }
    publishPatch(ModulationPatch::single(DSP::sanitize(config), routings));
    return PresetError::None;
}

std::shared_ptr<const ModulationPatch> LfoEngine::livePatch() const {
    return live_.load(std::memory_order_acquire);
}

// ==============================================================================
// Snapshots
// ==============================================================================

DSP::ClockState LfoEngine::clockState(double now) const noexcept {
    return clock_.currentState(now);
}

double LfoEngine::displayTempo(double now) const noexcept {
    const DSP::ClockState state = clock_.currentState(now);
    return state.tempoKnown ? DSP::snapTempoForDisplay(state.tempoBpm) : 0.0;
}

ConnectionState LfoEngine::connectionState() const noexcept {
    const uint8_t bits = connection_.load(std::memory_order_acquire);
    ConnectionState state;
    state.connected = (bits & kConnectedBit) != 0;
    state.deviceAvailable = (bits & kDeviceAvailableBit) != 0;
    return state;
}

OscillatorSnapshot LfoEngine::oscillatorSnapshot(DSP::LfoId id) const noexcept {
    if (id >= DSP::kMaxOscillators) {
        return OscillatorSnapshot{};
    }
    return oscillatorCells_[id].load();
}

bool LfoEngine::outboundValue(DSP::DestinationId destination, float& value) const noexcept {
    if (!DSP::isRoutableDestination(destination)) {
        return false;
    }
    const OutboundSnapshot snapshot = outboundCell_.load();
    const size_t index = DSP::destinationIndex(destination);
    if (!snapshot.valid[index]) {
        return false;
    }
    value = snapshot.values[index];
    return true;
}

OutboundSnapshot LfoEngine::outboundSnapshot() const noexcept {
    return outboundCell_.load();
}

uint64_t LfoEngine::emittedUpdateCount() const noexcept {
    return emittedCount_.load(std::memory_order_relaxed);
}

} // namespace Wtlfo
