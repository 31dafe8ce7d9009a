// ==============================================================================
// Layer 0: Core Utility - Destination Registry
// ==============================================================================
// Static table of LFO modulation destinations on the target device
// (Digitakt II, LFO destination appendix). Every entry is immutable and known
// at compile time; ranges and polarity never change at runtime.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (constexpr table, no allocation on lookup)
// - Principle IX: Layer 0 (depends only on stdlib)
// ==============================================================================

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Wtlfo {
namespace DSP {

// =============================================================================
// Identifiers
// =============================================================================

/// @brief Modulation destination identifier.
///
/// None is reserved for "not routed" and has no definition. The remaining
/// values index kDestinations directly (id - 1).
enum class DestinationId : uint8_t {
    None = 0,
    // SRC page
    SampleSlot,
    SampleBank,
    Pitch,
    PlayMode,
    SampleStart,
    SampleLength,
    SampleLoop,
    SampleLevel,
    // Filter page
    FilterFreq,
    FilterReso,
    FilterType,
    FilterEnvDelay,
    FilterAttack,
    FilterDecay,
    FilterSustain,
    FilterRelease,
    FilterEnvDepth,
    // AMP page
    AmpAttack,
    AmpHold,
    AmpDecay,
    AmpSustain,
    AmpRelease,
    Pan,
    Volume,
    // FX page
    ChorusSend,
    DelaySend,
    ReverbSend,
    BitReduction,
    SampleRateReduction,
    Overdrive
};

/// Number of routable destinations (excludes None)
inline constexpr size_t kDestinationCount = 30;

/// One slot per DestinationId value, including None
inline constexpr size_t kDestinationSlotCount = kDestinationCount + 1;

enum class DestinationCategory : uint8_t {
    Src = 0,
    Filter,
    Amp,
    Fx
};

inline constexpr size_t kDestinationCategoryCount = 4;

inline constexpr std::array<DestinationCategory, kDestinationCategoryCount> kCategoryOrder = {
    DestinationCategory::Src,
    DestinationCategory::Filter,
    DestinationCategory::Amp,
    DestinationCategory::Fx
};

[[nodiscard]] constexpr std::string_view categoryLabel(DestinationCategory category) noexcept {
    switch (category) {
        case DestinationCategory::Src: return "SRC";
        case DestinationCategory::Filter: return "FILTER";
        case DestinationCategory::Amp: return "AMP";
        case DestinationCategory::Fx: return "FX";
    }
    return {};
}

// =============================================================================
// DestinationDefinition
// =============================================================================

/// @brief Immutable description of one modulation destination.
struct DestinationDefinition {
    DestinationId id = DestinationId::None;
    std::string_view key;          ///< Stable identifier used in saved data
    std::string_view name;         ///< Full display name
    std::string_view displayName;  ///< Short label (device style)
    float min = 0.0f;
    float max = 127.0f;
    float defaultValue = 0.0f;
    std::string_view unit;         ///< Optional unit label (may be empty)
    DestinationCategory category = DestinationCategory::Src;
    bool bipolar = false;          ///< Natural center is 0 rather than the midpoint

    [[nodiscard]] constexpr float range() const noexcept { return max - min; }

    [[nodiscard]] constexpr float midpoint() const noexcept { return min + range() * 0.5f; }

    /// Center a routing without override modulates around.
    ///
    /// Bipolar destinations whose range contains 0 center on 0, everything
    /// else centers on the midpoint of its range.
    [[nodiscard]] constexpr float naturalCenter() const noexcept {
        if (bipolar && min <= 0.0f && max >= 0.0f) {
            return 0.0f;
        }
        return midpoint();
    }

    [[nodiscard]] constexpr float clamp(float value) const noexcept {
        return std::clamp(value, min, max);
    }
};

// =============================================================================
// Table
// =============================================================================

// clang-format off
inline constexpr std::array<DestinationDefinition, kDestinationCount> kDestinations = {{
    // SRC
    {DestinationId::SampleSlot,     "sample_slot",      "Sample Slot",      "SLOT", 0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Src,    false},
    {DestinationId::SampleBank,     "sample_bank",      "Sample Bank",      "BANK", 0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Src,    false},
    {DestinationId::Pitch,          "pitch",            "Pitch",            "TUNE", -24.0f, 24.0f,  0.0f,   "st",  DestinationCategory::Src,    true},
    {DestinationId::PlayMode,       "play_mode",        "Play Mode",        "PLAY", 0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Src,    false},
    {DestinationId::SampleStart,    "sample_start",     "Sample Start",     "STRT", 0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Src,    false},
    {DestinationId::SampleLength,   "sample_length",    "Sample Length",    "LEN",  0.0f,   127.0f, 127.0f, "",    DestinationCategory::Src,    false},
    {DestinationId::SampleLoop,     "sample_loop",      "Loop Position",    "LOOP", 0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Src,    false},
    {DestinationId::SampleLevel,    "sample_level",     "Sample Level",     "LEV",  0.0f,   127.0f, 100.0f, "",    DestinationCategory::Src,    false},
    // FILTER
    {DestinationId::FilterFreq,     "filter_freq",      "Filter Frequency", "FREQ", 0.0f,   127.0f, 127.0f, "",    DestinationCategory::Filter, false},
    {DestinationId::FilterReso,     "filter_reso",      "Filter Resonance", "RESO", 0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Filter, false},
    {DestinationId::FilterType,     "filter_type",      "Filter Type",      "TYPE", 0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Filter, false},
    {DestinationId::FilterEnvDelay, "filter_env_delay", "Filter Env Delay", "DEL",  0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Filter, false},
    {DestinationId::FilterAttack,   "filter_attack",    "Filter Attack",    "ATK",  0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Filter, false},
    {DestinationId::FilterDecay,    "filter_decay",     "Filter Decay",     "DEC",  0.0f,   127.0f, 64.0f,  "",    DestinationCategory::Filter, false},
    {DestinationId::FilterSustain,  "filter_sustain",   "Filter Sustain",   "SUS",  0.0f,   127.0f, 127.0f, "",    DestinationCategory::Filter, false},
    {DestinationId::FilterRelease,  "filter_release",   "Filter Release",   "REL",  0.0f,   127.0f, 64.0f,  "",    DestinationCategory::Filter, false},
    {DestinationId::FilterEnvDepth, "filter_env_depth", "Filter Env Depth", "F.ENV", -64.0f, 63.0f, 0.0f,   "",    DestinationCategory::Filter, true},
    // AMP
    {DestinationId::AmpAttack,      "amp_attack",       "Amp Attack",       "ATK",  0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Amp,    false},
    {DestinationId::AmpHold,        "amp_hold",         "Amp Hold",         "HLD",  0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Amp,    false},
    {DestinationId::AmpDecay,       "amp_decay",        "Amp Decay",        "DEC",  0.0f,   127.0f, 64.0f,  "",    DestinationCategory::Amp,    false},
    {DestinationId::AmpSustain,     "amp_sustain",      "Amp Sustain",      "SUS",  0.0f,   127.0f, 127.0f, "",    DestinationCategory::Amp,    false},
    {DestinationId::AmpRelease,     "amp_release",      "Amp Release",      "REL",  0.0f,   127.0f, 64.0f,  "",    DestinationCategory::Amp,    false},
    {DestinationId::Pan,            "pan",              "Pan",              "PAN",  -64.0f, 63.0f,  0.0f,   "L/R", DestinationCategory::Amp,    true},
    {DestinationId::Volume,         "volume",           "Volume",           "VOL",  0.0f,   127.0f, 100.0f, "",    DestinationCategory::Amp,    false},
    // FX
    {DestinationId::ChorusSend,     "chorus_send",      "Chorus Send",      "CHO",  0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Fx,     false},
    {DestinationId::DelaySend,      "delay_send",       "Delay Send",       "DLY",  0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Fx,     false},
    {DestinationId::ReverbSend,     "reverb_send",      "Reverb Send",      "REV",  0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Fx,     false},
    {DestinationId::BitReduction,   "bit_reduction",    "Bit Reduction",    "BIT",  0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Fx,     false},
    {DestinationId::SampleRateReduction, "srr",         "Sample Rate Reduction", "SRR", 0.0f, 127.0f, 0.0f, "",    DestinationCategory::Fx,     false},
    {DestinationId::Overdrive,      "overdrive",        "Overdrive",        "OVR",  0.0f,   127.0f, 0.0f,   "",    DestinationCategory::Fx,     false},
}};
// clang-format on

/// Keys used by earlier releases, mapped to their current destination
struct LegacyDestinationKey {
    std::string_view key;
    DestinationId id;
};

inline constexpr std::array<LegacyDestinationKey, 5> kLegacyDestinationKeys = {{
    {"filter_cutoff", DestinationId::FilterFreq},
    {"filter_resonance", DestinationId::FilterReso},
    {"pitch_fine", DestinationId::Pitch},
    {"amp_overdrive", DestinationId::Overdrive},
    {"filter_drive", DestinationId::Overdrive},
}};

// =============================================================================
// Lookup
// =============================================================================

/// @brief Index of a destination in kDestinations / RoutingSet slots.
[[nodiscard]] constexpr size_t destinationIndex(DestinationId id) noexcept {
    return static_cast<size_t>(id);
}

/// @brief Check whether an id names a routable destination.
[[nodiscard]] constexpr bool isRoutableDestination(DestinationId id) noexcept {
    const auto index = static_cast<size_t>(id);
    return index >= 1 && index <= kDestinationCount;
}

/// @brief Look up a destination definition.
/// @return Pointer into the static table, or nullptr for None / invalid ids
[[nodiscard]] constexpr const DestinationDefinition* getDestination(DestinationId id) noexcept {
    if (!isRoutableDestination(id)) {
        return nullptr;
    }
    return &kDestinations[static_cast<size_t>(id) - 1];
}

/// @brief Convert a raw byte (e.g. from a saved stream) to a DestinationId.
/// Unknown values map to None.
[[nodiscard]] constexpr DestinationId destinationFromIndex(int value) noexcept {
    if (value < 1 || value > static_cast<int>(kDestinationCount)) {
        return DestinationId::None;
    }
    return static_cast<DestinationId>(value);
}

/// @brief Resolve a stored key to a destination, migrating legacy keys.
///
/// "none" and unknown keys resolve to None.
[[nodiscard]] constexpr DestinationId destinationFromKey(std::string_view key) noexcept {
    for (const auto& def : kDestinations) {
        if (def.key == key) {
            return def.id;
        }
    }
    for (const auto& legacy : kLegacyDestinationKeys) {
        if (legacy.key == key) {
            return legacy.id;
        }
    }
    return DestinationId::None;
}

/// @brief Stored key for a destination ("none" for None).
[[nodiscard]] constexpr std::string_view destinationKey(DestinationId id) noexcept {
    const auto* def = getDestination(id);
    return def != nullptr ? def->key : std::string_view{"none"};
}

/// @brief Count destinations in a category.
[[nodiscard]] constexpr size_t countDestinationsInCategory(DestinationCategory category) noexcept {
    return static_cast<size_t>(std::count_if(
        kDestinations.begin(), kDestinations.end(),
        [category](const DestinationDefinition& d) { return d.category == category; }));
}

/// @brief Visit every destination in a category, in table order.
template <typename Visitor>
constexpr void forEachDestinationInCategory(DestinationCategory category, Visitor&& visit) {
    for (const auto& def : kDestinations) {
        if (def.category == category) {
            visit(def);
        }
    }
}

} // namespace DSP
} // namespace Wtlfo
