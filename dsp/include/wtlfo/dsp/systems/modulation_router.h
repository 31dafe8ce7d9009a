// ==============================================================================
// Layer 3: System Component - Modulation Router
// ==============================================================================
// Maps LFO samples onto destination values.
//
// Routings are kept in a fixed table indexed by destination, so each
// destination has its own independent routing state and assigning one
// destination can never overwrite another. Any number of destinations may be
// driven by the same oscillator.
//
// Processing formula:
// @code
// effective = sample * (depth / 100) * (amount / 100)
// center    = override (clamped into range) or destination.naturalCenter()
// value     = clamp(center + effective * (max - min) / 2, min, max)
// @endcode
//
// For unipolar destinations the natural center is the midpoint, so the value
// equals min + (effective + 1) / 2 * (max - min).
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (fixed-size storage, no allocation)
// - Principle III: Modern C++ (C++20)
// - Principle IX: Layer 3 (depends on Layer 0)
// ==============================================================================

#pragma once

#include <wtlfo/dsp/core/destination_registry.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Wtlfo {
namespace DSP {

// =============================================================================
// Oscillator identifiers
// =============================================================================

/// Oscillator slot index within a patch.
using LfoId = uint8_t;

inline constexpr LfoId kPrimaryLfo = 0;

/// Oscillators per patch.
inline constexpr size_t kMaxOscillators = 8;

inline constexpr float kMinRoutingAmount = 0.0f;
inline constexpr float kMaxRoutingAmount = 100.0f;

/// Default minimum change before a destination value is re-sent.
inline constexpr float kDefaultMinOutboundDelta = 0.5f;

// =============================================================================
// Routing
// =============================================================================

/// @brief One oscillator-to-destination connection.
struct Routing {
    LfoId lfo = kPrimaryLfo;
    DestinationId destination = DestinationId::None;
    float amount = kMaxRoutingAmount;   ///< 0..100 %
    bool hasCenterOverride = false;
    float centerOverride = 0.0f;        ///< Used when hasCenterOverride
    bool active = false;                ///< Whether this slot is in use

    bool operator==(const Routing&) const = default;
};

// =============================================================================
// RoutingSet
// =============================================================================

/// @brief Independent routing per destination.
class RoutingSet {
public:
    /// @brief Store a routing in its destination's slot.
    /// @return false if the routing names no routable destination or an
    ///         oscillator outside the patch capacity
    bool assign(Routing routing) noexcept {
        if (!isRoutableDestination(routing.destination) || routing.lfo >= kMaxOscillators) {
            return false;
        }
        routing.amount = clampAmount(routing.amount);
        if (!std::isfinite(routing.centerOverride)) {
            routing.hasCenterOverride = false;
            routing.centerOverride = 0.0f;
        }
        routing.active = true;
        slots_[destinationIndex(routing.destination)] = routing;
        return true;
    }

    /// Convenience overload.
    bool assign(DestinationId destination, float amount, LfoId lfo = kPrimaryLfo) noexcept {
        Routing routing;
        routing.lfo = lfo;
        routing.destination = destination;
        routing.amount = amount;
        return assign(routing);
    }

    /// @return true if a routing was removed
    bool remove(DestinationId destination) noexcept {
        if (!isRoutableDestination(destination)) {
            return false;
        }
        auto& slot = slots_[destinationIndex(destination)];
        if (!slot.active) {
            return false;
        }
        slot = Routing{};
        return true;
    }

    void clear() noexcept { slots_.fill(Routing{}); }

    /// @return The routing for a destination, or nullptr if unrouted
    [[nodiscard]] const Routing* find(DestinationId destination) const noexcept {
        if (!isRoutableDestination(destination)) {
            return nullptr;
        }
        const auto& slot = slots_[destinationIndex(destination)];
        return slot.active ? &slot : nullptr;
    }

    [[nodiscard]] bool contains(DestinationId destination) const noexcept {
        return find(destination) != nullptr;
    }

    bool setAmount(DestinationId destination, float amount) noexcept {
        Routing* slot = findMutable(destination);
        if (slot == nullptr) {
            return false;
        }
        slot->amount = clampAmount(amount);
        return true;
    }

    bool setCenterOverride(DestinationId destination, float center) noexcept {
        Routing* slot = findMutable(destination);
        if (slot == nullptr || !std::isfinite(center)) {
            return false;
        }
        slot->hasCenterOverride = true;
        slot->centerOverride = center;
        return true;
    }

    bool clearCenterOverride(DestinationId destination) noexcept {
        Routing* slot = findMutable(destination);
        if (slot == nullptr) {
            return false;
        }
        slot->hasCenterOverride = false;
        slot->centerOverride = 0.0f;
        return true;
    }

    /// Number of active routings.
    [[nodiscard]] size_t size() const noexcept {
        return static_cast<size_t>(std::count_if(
            slots_.begin(), slots_.end(), [](const Routing& r) { return r.active; }));
    }

    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    /// Visit active routings in destination order.
    template <typename Visitor>
    void forEach(Visitor&& visit) const {
        for (const auto& slot : slots_) {
            if (slot.active) {
                visit(slot);
            }
        }
    }

    bool operator==(const RoutingSet&) const = default;

private:
    [[nodiscard]] static float clampAmount(float amount) noexcept {
        if (!std::isfinite(amount)) {
            return kMaxRoutingAmount;
        }
        return std::clamp(amount, kMinRoutingAmount, kMaxRoutingAmount);
    }

    [[nodiscard]] Routing* findMutable(DestinationId destination) noexcept {
        if (!isRoutableDestination(destination)) {
            return nullptr;
        }
        auto& slot = slots_[destinationIndex(destination)];
        return slot.active ? &slot : nullptr;
    }

    std::array<Routing, kDestinationSlotCount> slots_{};
};

// =============================================================================
// Resolution
// =============================================================================

/// @brief Center a routing modulates around.
[[nodiscard]] inline float routingCenter(
    const Routing& routing,
    const DestinationDefinition& destination
) noexcept {
    if (routing.hasCenterOverride && std::isfinite(routing.centerOverride)) {
        return destination.clamp(routing.centerOverride);
    }
    return destination.naturalCenter();
}

/// @brief Map an LFO sample to a destination value.
///
/// @param sample LFO sample [-1, 1]; non-finite samples resolve as 0
/// @param depthPercent Oscillator depth 0..100
/// @param routing Routing providing amount and optional center
/// @param destination Target destination
/// @return Value clamped into [destination.min, destination.max]
[[nodiscard]] inline float resolveModulation(
    float sample,
    float depthPercent,
    const Routing& routing,
    const DestinationDefinition& destination
) noexcept {
    if (!std::isfinite(sample)) {
        sample = 0.0f;
    }
    const float depth = std::isfinite(depthPercent) ? std::clamp(depthPercent, 0.0f, 100.0f) : 0.0f;
    const float amount = std::isfinite(routing.amount)
        ? std::clamp(routing.amount, kMinRoutingAmount, kMaxRoutingAmount)
        : 0.0f;

    const float effective = std::clamp(sample, -1.0f, 1.0f) * (depth / 100.0f) * (amount / 100.0f);
    const float center = routingCenter(routing, destination);
    return destination.clamp(center + effective * destination.range() * 0.5f);
}

/// @brief Lowest and highest value a routing can reach.
struct ModulationSpan {
    float low = 0.0f;
    float high = 0.0f;
};

/// @brief Reachable value range for display (sample swept over [-1, 1]).
[[nodiscard]] inline ModulationSpan computeModulationSpan(
    float depthPercent,
    const Routing& routing,
    const DestinationDefinition& destination
) noexcept {
    const float a = resolveModulation(-1.0f, depthPercent, routing, destination);
    const float b = resolveModulation(1.0f, depthPercent, routing, destination);
    return {std::min(a, b), std::max(a, b)};
}

// =============================================================================
// OutboundValueFilter
// =============================================================================

/// @brief Suppresses updates that do not move a destination far enough.
///
/// A value passes when nothing was emitted for the destination yet, or when
/// it differs from the last emitted value by at least the minimum delta.
class OutboundValueFilter {
public:
    explicit OutboundValueFilter(float minDelta = kDefaultMinOutboundDelta) noexcept {
        setMinDelta(minDelta);
    }

    void setMinDelta(float minDelta) noexcept {
        minDelta_ = (std::isfinite(minDelta) && minDelta >= 0.0f) ? minDelta : kDefaultMinOutboundDelta;
    }

    [[nodiscard]] float minDelta() const noexcept { return minDelta_; }

    /// @brief Decide whether to emit, recording the value if so.
    [[nodiscard]] bool shouldEmit(DestinationId destination, float value) noexcept {
        if (!isRoutableDestination(destination) || !std::isfinite(value)) {
            return false;
        }
        const size_t index = destinationIndex(destination);
        if (hasEmitted_[index] && std::abs(value - lastEmitted_[index]) < minDelta_) {
            return false;
        }
        hasEmitted_[index] = true;
        lastEmitted_[index] = value;
        return true;
    }

    /// @return true if a value was emitted for the destination since reset
    [[nodiscard]] bool lastEmitted(DestinationId destination, float& value) const noexcept {
        if (!isRoutableDestination(destination)) {
            return false;
        }
        const size_t index = destinationIndex(destination);
        value = lastEmitted_[index];
        return hasEmitted_[index];
    }

    void reset() noexcept {
        hasEmitted_.fill(false);
        lastEmitted_.fill(0.0f);
    }

    void reset(DestinationId destination) noexcept {
        if (isRoutableDestination(destination)) {
            hasEmitted_[destinationIndex(destination)] = false;
        }
    }

private:
    float minDelta_ = kDefaultMinOutboundDelta;
    std::array<float, kDestinationSlotCount> lastEmitted_{};
    std::array<bool, kDestinationSlotCount> hasEmitted_{};
};

} // namespace DSP
} // namespace Wtlfo
