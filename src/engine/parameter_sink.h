#pragma once

// ==============================================================================
// ParameterSink - Outbound side of the MIDI transport collaborator
// ==============================================================================
// The engine never talks to a MIDI port directly. It hands resolved values to
// a ParameterSink; ControlChangeSink turns them into MIDI 1.0 Control Change
// bytes for sinks that speak plain MIDI.
// ==============================================================================

#include <wtlfo/dsp/core/destination_registry.h>
#include <wtlfo/dsp/core/midi_utils.h>

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Wtlfo {

/// Link state reported by the transport collaborator.
struct ConnectionState {
    bool connected = false;
    bool deviceAvailable = false;

    /// True when updates can reach the device.
    [[nodiscard]] bool isUsable() const noexcept { return connected && deviceAvailable; }

    bool operator==(const ConnectionState&) const = default;
};

/// Receives resolved destination values. Called from the scheduler context;
/// implementations must not block.
class ParameterSink {
public:
    virtual ~ParameterSink() = default;

    virtual void sendParameterUpdate(DSP::DestinationId destination, float value) = 0;
};

/// Raw byte output (e.g. a MIDI port). Called from the scheduler context.
class MidiByteOutput {
public:
    virtual ~MidiByteOutput() = default;

    virtual void sendBytes(const uint8_t* data, size_t size) = 0;
};

/// Encodes destination updates as Control Change messages.
///
/// Each destination is mapped to a controller number; unmapped destinations
/// are dropped. Values are offset by -min so bipolar ranges (pan -64..63)
/// land on the 0..127 data range.
class ControlChangeSink final : public ParameterSink {
public:
    static constexpr uint8_t kUnmapped = 0xFF;

    ControlChangeSink(MidiByteOutput& output, uint8_t channel) noexcept
        : output_(output)
        , channel_(static_cast<uint8_t>(channel & 0x0F)) {
        controllers_.fill(kUnmapped);
    }

    /// Map a destination to a controller number (0-127).
    bool mapController(DSP::DestinationId destination, uint8_t controller) noexcept {
        if (!DSP::isRoutableDestination(destination) || controller > DSP::kMaxMidiDataValue) {
            return false;
        }
        controllers_[DSP::destinationIndex(destination)] = controller;
        return true;
    }

    void unmapController(DSP::DestinationId destination) noexcept {
        if (DSP::isRoutableDestination(destination)) {
            controllers_[DSP::destinationIndex(destination)] = kUnmapped;
        }
    }

    [[nodiscard]] uint8_t controllerFor(DSP::DestinationId destination) const noexcept {
        return DSP::isRoutableDestination(destination)
            ? controllers_[DSP::destinationIndex(destination)]
            : kUnmapped;
    }

    void setChannel(uint8_t channel) noexcept { channel_ = static_cast<uint8_t>(channel & 0x0F); }

    [[nodiscard]] uint8_t channel() const noexcept { return channel_; }

    void sendParameterUpdate(DSP::DestinationId destination, float value) override {
        const auto* def = DSP::getDestination(destination);
        const uint8_t controller = controllerFor(destination);
        if (def == nullptr || controller == kUnmapped) {
            return;
        }
        DSP::MidiControlChange cc;
        cc.channel = channel_;
        cc.controller = controller;
        cc.value = DSP::toMidiDataByte(value, -static_cast<int>(std::lround(def->min)));
        const auto bytes = DSP::encodeControlChange(cc);
        output_.sendBytes(bytes.data(), bytes.size());
    }

private:
    MidiByteOutput& output_;
    uint8_t channel_ = 0;
    std::array<uint8_t, DSP::kDestinationSlotCount> controllers_{};
};

} // namespace Wtlfo
