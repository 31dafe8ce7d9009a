// ==============================================================================
// Layer 0: Core Utility - Snapshot Cell
// ==============================================================================
// Single-writer / multi-reader publication of a small trivially-copyable
// value (sequence lock). The writer never blocks; readers retry until they
// observe a sequence number that did not change across their copy, so a
// reader can never see half of one write and half of another.
//
// The payload is stored as relaxed atomic 64-bit words, so concurrent
// reads and writes of the payload are not data races.
//
// Constitution Compliance:
// - Principle II: Real-Time Safety (lock-free, no allocation)
// - Principle IX: Layer 0 (depends only on stdlib)
// ==============================================================================

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace Wtlfo {
namespace DSP {

/// @brief Lock-free single-writer snapshot of a trivially copyable value.
///
/// Exactly one thread may call publish(). Any number of threads may call
/// load() concurrently with it.
///
/// @tparam T Trivially copyable payload
template <typename T>
class SnapshotCell {
    static_assert(std::is_trivially_copyable_v<T>, "SnapshotCell requires a trivially copyable type");
    static_assert(std::is_default_constructible_v<T>, "SnapshotCell requires a default constructible type");

public:
    SnapshotCell() noexcept { publish(T{}); }

    explicit SnapshotCell(const T& initial) noexcept { publish(initial); }

    SnapshotCell(const SnapshotCell&) = delete;
    SnapshotCell& operator=(const SnapshotCell&) = delete;

    /// Writer side. Must only be called from one thread.
    void publish(const T& value) noexcept {
        std::array<uint64_t, kWordCount> words{};
        std::memcpy(words.data(), &value, sizeof(T));

        const uint64_t seq = sequence_.load(std::memory_order_relaxed);
        sequence_.store(seq + 1, std::memory_order_relaxed);  // odd: write in progress
        std::atomic_thread_fence(std::memory_order_release);

        for (size_t i = 0; i < kWordCount; ++i) {
            words_[i].store(words[i], std::memory_order_relaxed);
        }

        sequence_.store(seq + 2, std::memory_order_release);  // even: stable
    }

    /// Reader side. Returns the most recent complete publication.
    [[nodiscard]] T load() const noexcept {
        std::array<uint64_t, kWordCount> words{};
        for (;;) {
            const uint64_t before = sequence_.load(std::memory_order_acquire);
            if ((before & 1u) != 0) {
                continue;
            }
            for (size_t i = 0; i < kWordCount; ++i) {
                words[i] = words_[i].load(std::memory_order_relaxed);
            }
            std::atomic_thread_fence(std::memory_order_acquire);
            if (sequence_.load(std::memory_order_relaxed) == before) {
                break;
            }
        }
        T value{};
        std::memcpy(&value, words.data(), sizeof(T));
        return value;
    }

    /// Number of completed publications (diagnostics / tests).
    [[nodiscard]] uint64_t version() const noexcept {
        return sequence_.load(std::memory_order_acquire) / 2;
    }

private:
    static constexpr size_t kWordCount = (sizeof(T) + sizeof(uint64_t) - 1) / sizeof(uint64_t);

    std::atomic<uint64_t> sequence_{0};
    std::array<std::atomic<uint64_t>, kWordCount> words_{};
};

} // namespace DSP
} // namespace Wtlfo
