// ==============================================================================
// Parameter Sink Unit Tests
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include "engine/parameter_sink.h"

#include <cstdint>
#include <vector>

using namespace Wtlfo;

namespace {

class RecordingOutput final : public MidiByteOutput {
public:
    void sendBytes(const uint8_t* data, size_t size) override {
        bytes.insert(bytes.end(), data, data + size);
    }
    std::vector<uint8_t> bytes;
};

} // namespace

TEST_CASE("ConnectionState usability", "[parameter_sink]") {
    ConnectionState state;
    CHECK_FALSE(state.isUsable());
    state.connected = true;
    CHECK_FALSE(state.isUsable());
    state.deviceAvailable = true;
    CHECK(state.isUsable());
}

TEST_CASE("ControlChangeSink encodes mapped destinations", "[parameter_sink]") {
    RecordingOutput output;
    ControlChangeSink sink(output, 2);
    REQUIRE(sink.mapController(DSP::DestinationId::FilterFreq, 74));
    REQUIRE(sink.mapController(DSP::DestinationId::Pan, 10));

    sink.sendParameterUpdate(DSP::DestinationId::FilterFreq, 100.4f);
    REQUIRE(output.bytes.size() == 3);
    CHECK(output.bytes[0] == 0xB2);
    CHECK(output.bytes[1] == 74);
    CHECK(output.bytes[2] == 100);

    SECTION("bipolar destinations are offset into the data range") {
        output.bytes.clear();
        sink.sendParameterUpdate(DSP::DestinationId::Pan, -64.0f);
        sink.sendParameterUpdate(DSP::DestinationId::Pan, 0.0f);
        REQUIRE(output.bytes.size() == 6);
        CHECK(output.bytes[2] == 0);
        CHECK(output.bytes[5] == 64);
    }

    SECTION("unmapped destinations are dropped") {
        output.bytes.clear();
        sink.sendParameterUpdate(DSP::DestinationId::Volume, 50.0f);
        sink.unmapController(DSP::DestinationId::FilterFreq);
        sink.sendParameterUpdate(DSP::DestinationId::FilterFreq, 50.0f);
        CHECK(output.bytes.empty());
    }
}

TEST_CASE("ControlChangeSink validates mappings", "[parameter_sink]") {
    RecordingOutput output;
    ControlChangeSink sink(output, 0x1F);
    CHECK(sink.channel() == 0x0F);
    CHECK_FALSE(sink.mapController(DSP::DestinationId::None, 1));
    CHECK_FALSE(sink.mapController(DSP::DestinationId::Volume, 128));
    CHECK(sink.controllerFor(DSP::DestinationId::Volume) == ControlChangeSink::kUnmapped);
}
