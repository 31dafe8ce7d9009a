#pragma once

// ==============================================================================
// PresetStore - Named oscillator + routing snapshots
// ==============================================================================
// Holds presets in insertion order. Every preset owns a copy of its
// configuration and routings, so editing the live configuration after a
// save can never reach into a stored preset.
//
// Thread Safety: All methods must be called from the control (UI) thread.
// Activation happens through LfoEngine::loadPreset, which copies the preset
// into a new patch before publishing it.
// ==============================================================================

#include <wtlfo/dsp/core/oscillator_config.h>
#include <wtlfo/dsp/systems/modulation_router.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Steinberg {
    class IBStream;
}

namespace Wtlfo {

/// Outcome of a preset operation.
enum class PresetError : uint8_t {
    None = 0,
    DuplicateName,   ///< save: a preset with this name exists
    OutOfRange,      ///< load / remove / overwrite: no preset at index
    InvalidName,     ///< save: empty, too long or contains reserved characters
    StreamError      ///< writeTo / readFrom failed or data was malformed
};

[[nodiscard]] const char* presetErrorName(PresetError error) noexcept;

struct Preset {
    std::string name;
    DSP::OscillatorConfig config;
    DSP::RoutingSet routings;

    bool operator==(const Preset&) const = default;
};

/// Current stream format version written by writeTo().
inline constexpr int32_t kPresetStreamVersion = 1;

/// Longest accepted preset name.
inline constexpr size_t kMaxPresetNameLength = 64;

class PresetStore {
public:
    using PresetList = std::vector<Preset>;

    PresetStore() = default;

    // ==========================================================================
    // Operations
    // ==========================================================================

    /// Append a preset. Fails with DuplicateName or InvalidName; the store is
    /// unchanged on failure.
    PresetError save(const std::string& name,
                     const DSP::OscillatorConfig& config,
                     const DSP::RoutingSet& routings);

    /// Copy a preset out. Fails with OutOfRange.
    PresetError load(size_t index,
                     DSP::OscillatorConfig& config,
                     DSP::RoutingSet& routings);

    /// Replace the contents of an existing preset, keeping name and position.
    PresetError overwrite(size_t index,
                          const DSP::OscillatorConfig& config,
                          const DSP::RoutingSet& routings);

    /// Delete a preset. Fails with OutOfRange.
    PresetError remove(size_t index);

    /// Rename a preset. Fails with OutOfRange, InvalidName or DuplicateName.
    PresetError rename(size_t index, const std::string& name);

    void clear();

    // ==========================================================================
    // Queries
    // ==========================================================================

    /// All presets in insertion order.
    [[nodiscard]] const PresetList& list() const { return presets_; }

    [[nodiscard]] size_t size() const { return presets_.size(); }

    [[nodiscard]] bool empty() const { return presets_.empty(); }

    /// Preset at index, or nullptr.
    [[nodiscard]] const Preset* at(size_t index) const;

    [[nodiscard]] std::optional<size_t> indexOf(std::string_view name) const;

    // ==========================================================================
    // Serialization
    // ==========================================================================

    /// Write all presets, version-tagged. Returns false on stream failure.
    bool writeTo(Steinberg::IBStream* stream);

    /// Replace all presets with the stream contents. The store is unchanged
    /// if the stream is malformed.
    bool readFrom(Steinberg::IBStream* stream);

    // ==========================================================================
    // Validation
    // ==========================================================================

    /// Names must be non-empty, at most kMaxPresetNameLength characters,
    /// not only whitespace, and free of control or reserved characters.
    static bool isValidPresetName(const std::string& name);

    /// Get last error message
    std::string getLastError() const { return lastError_; }

    /// Error code of the last failed operation (None after a success).
    [[nodiscard]] PresetError lastErrorCode() const { return lastErrorCode_; }

private:
    PresetError fail(PresetError error, std::string message);
    PresetError succeed();

    PresetList presets_;
    std::string lastError_;
    PresetError lastErrorCode_ = PresetError::None;
};

} // namespace Wtlfo
