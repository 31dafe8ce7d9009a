#include "preset_store.h"
#include "parameters/oscillator_params.h"

#include "base/source/fstreamer.h"
#include "pluginterfaces/base/ibstream.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <ranges>
#include <utility>

namespace Wtlfo {

const char* presetErrorName(PresetError error) noexcept {
    switch (error) {
        case PresetError::None: return "None";
        case PresetError::DuplicateName: return "DuplicateName";
        case PresetError::OutOfRange: return "OutOfRange";
        case PresetError::InvalidName: return "InvalidName";
        case PresetError::StreamError: return "StreamError";
    }
    return "Unknown";
}

// =============================================================================
// Operations
// =============================================================================

PresetError PresetStore::save(const std::string& name,
                              const DSP::OscillatorConfig& config,
                              const DSP::RoutingSet& routings) {
    if (!isValidPresetName(name)) {
        return fail(PresetError::InvalidName, "Invalid preset name");
    }
    if (indexOf(name).has_value()) {
        return fail(PresetError::DuplicateName, "A preset named '" + name + "' already exists");
    }

    presets_.push_back(Preset{name, config, routings});
    return succeed();
}

PresetError PresetStore::load(size_t index,
                              DSP::OscillatorConfig& config,
                              DSP::RoutingSet& routings) {
    if (index >= presets_.size()) {
        return fail(PresetError::OutOfRange, "Preset index " + std::to_string(index) + " out of range");
    }
    config = presets_[index].config;
    routings = presets_[index].routings;
    return succeed();
}

PresetError PresetStore::overwrite(size_t index,
                                   const DSP::OscillatorConfig& config,
                                   const DSP::RoutingSet& routings) {
    if (index >= presets_.size()) {
        return fail(PresetError::OutOfRange, "Preset index " + std::to_string(index) + " out of range");
    }
    presets_[index].config = config;
    presets_[index].routings = routings;
    return succeed();
}

PresetError PresetStore::remove(size_t index) {
    if (index >= presets_.size()) {
        return fail(PresetError::OutOfRange, "Preset index " + std::to_string(index) + " out of range");
    }
    presets_.erase(presets_.begin() + static_cast<std::ptrdiff_t>(index));
    return succeed();
}

PresetError PresetStore::rename(size_t index, const std::string& name) {
    if (index >= presets_.size()) {
        return fail(PresetError::OutOfRange, "Preset index " + std::to_string(index) + " out of range");
    }
    if (!isValidPresetName(name)) {
        return fail(PresetError::InvalidName, "Invalid preset name");
    }
    auto existing = indexOf(name);
    if (existing.has_value() && *existing != index) {
        return fail(PresetError::DuplicateName, "A preset named '" + name + "' already exists");
    }
    presets_[index].name = name;
    return succeed();
}

void PresetStore::clear() {
    presets_.clear();
    succeed();
}

// =============================================================================
// Queries
// =============================================================================

const Preset* PresetStore::at(size_t index) const {
    return index < presets_.size() ? &presets_[index] : nullptr;
}

std::optional<size_t> PresetStore::indexOf(std::string_view name) const {
    auto it = std::ranges::find_if(presets_, [name](const Preset& p) { return p.name == name; });
    if (it == presets_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(presets_.begin(), it));
}

// =============================================================================
// Serialization
// =============================================================================

bool PresetStore::writeTo(Steinberg::IBStream* stream) {
    if (stream == nullptr) {
        fail(PresetError::StreamError, "No stream");
        return false;
    }

    Steinberg::IBStreamer streamer(stream, kLittleEndian);
    bool ok = streamer.writeInt32(kPresetStreamVersion);
    ok = ok && streamer.writeInt32(static_cast<Steinberg::int32>(presets_.size()));
    for (const auto& preset : presets_) {
        if (!ok) {
            break;
        }
        ok = streamer.writeStr8(preset.name.c_str())
            && saveOscillatorConfig(preset.config, streamer)
            && saveRoutingSet(preset.routings, streamer);
    }

    if (!ok) {
        fail(PresetError::StreamError, "Failed to write preset stream");
        return false;
    }
    succeed();
    return true;
}

bool PresetStore::readFrom(Steinberg::IBStream* stream) {
    if (stream == nullptr) {
        fail(PresetError::StreamError, "No stream");
        return false;
    }

    Steinberg::IBStreamer streamer(stream, kLittleEndian);
    Steinberg::int32 version = 0;
    if (!streamer.readInt32(version)) {
        fail(PresetError::StreamError, "Missing preset stream version");
        return false;
    }
    if (version < 1 || version > kPresetStreamVersion) {
        fail(PresetError::StreamError, "Unsupported preset stream version " + std::to_string(version));
        return false;
    }

    Steinberg::int32 count = 0;
    if (!streamer.readInt32(count) || count < 0) {
        fail(PresetError::StreamError, "Malformed preset count");
        return false;
    }

    PresetList loaded;
    for (Steinberg::int32 i = 0; i < count; ++i) {
        Preset preset;
        if (!readString(streamer, preset.name)) {
            fail(PresetError::StreamError, "Truncated preset name at entry " + std::to_string(i));
            return false;
        }
        if (!loadOscillatorConfig(preset.config, streamer) ||
            !loadRoutingSet(preset.routings, streamer)) {
            fail(PresetError::StreamError, "Truncated preset data for '" + preset.name + "'");
            return false;
        }
        const bool duplicate = std::ranges::any_of(
            loaded, [&preset](const Preset& p) { return p.name == preset.name; });
        if (!isValidPresetName(preset.name) || duplicate) {
            fail(PresetError::StreamError, "Invalid or duplicate preset name '" + preset.name + "'");
            return false;
        }
        loaded.push_back(std::move(preset));
    }

    presets_ = std::move(loaded);
    succeed();
    return true;
}

// =============================================================================
// Validation
// =============================================================================

bool PresetStore::isValidPresetName(const std::string& name) {
    if (name.empty() || name.length() > kMaxPresetNameLength) {
        return false;
    }

    if (std::ranges::all_of(name, [](unsigned char c) { return std::isspace(c) != 0; })) {
        return false;
    }

    const std::string kInvalidChars = "/\\:*?\"<>|";
    return std::ranges::none_of(name, [&kInvalidChars](char c) {
        return std::iscntrl(static_cast<unsigned char>(c)) != 0 ||
               kInvalidChars.find(c) != std::string::npos;
    });
}

PresetError PresetStore::fail(PresetError error, std::string message) {
    lastErrorCode_ = error;
    lastError_ = std::move(message);
    return error;
}

PresetError PresetStore::succeed() {
    lastErrorCode_ = PresetError::None;
    lastError_.clear();
    return PresetError::None;
}

} // namespace Wtlfo
