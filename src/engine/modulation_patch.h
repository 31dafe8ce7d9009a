#pragma once

// ==============================================================================
// ModulationPatch - The live configuration
// ==============================================================================
// Oscillator configurations keyed by LFO id plus the routing set. A patch is
// immutable once published; changes are made by building a new patch and
// publishing it whole (LfoEngine::publishPatch).
// ==============================================================================

#include <wtlfo/dsp/core/oscillator_config.h>
#include <wtlfo/dsp/systems/modulation_router.h>

#include <array>
#include <cstddef>
#include <cstdint>

namespace Wtlfo {

struct OscillatorSlot {
    bool active = false;
    DSP::OscillatorConfig config;

    bool operator==(const OscillatorSlot&) const = default;
};

struct ModulationPatch {
    std::array<OscillatorSlot, DSP::kMaxOscillators> oscillators{};
    DSP::RoutingSet routings;
    uint64_t revision = 0;  ///< Assigned by the engine on publication

    /// Patch with one active oscillator in the primary slot.
    [[nodiscard]] static ModulationPatch single(const DSP::OscillatorConfig& config,
                                                const DSP::RoutingSet& routings) {
        ModulationPatch patch;
        patch.oscillators[DSP::kPrimaryLfo].active = true;
        patch.oscillators[DSP::kPrimaryLfo].config = config;
        patch.routings = routings;
        return patch;
    }

    /// Configuration of an active oscillator, or nullptr.
    [[nodiscard]] const DSP::OscillatorConfig* oscillator(DSP::LfoId id) const noexcept {
        if (id >= oscillators.size() || !oscillators[id].active) {
            return nullptr;
        }
        return &oscillators[id].config;
    }

    void setOscillator(DSP::LfoId id, const DSP::OscillatorConfig& config) noexcept {
        if (id < oscillators.size()) {
            oscillators[id].active = true;
            oscillators[id].config = config;
        }
    }

    void removeOscillator(DSP::LfoId id) noexcept {
        if (id < oscillators.size()) {
            oscillators[id] = OscillatorSlot{};
        }
    }

    [[nodiscard]] size_t activeOscillatorCount() const noexcept {
        size_t count = 0;
        for (const auto& slot : oscillators) {
            if (slot.active) ++count;
        }
        return count;
    }

    /// Content equality; the revision is ignored.
    [[nodiscard]] bool sameContent(const ModulationPatch& other) const noexcept {
        return oscillators == other.oscillators && routings == other.routings;
    }
};

} // namespace Wtlfo
