#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <vector>

namespace promptguard {

/**
 * @brief Lock-free bounded Multi-Producer Single-Consumer ring buffer
 *
 * Each slot carries a sequence number:
 * - seq == pos            slot is free for the producer claiming position pos
 * - seq == pos + 1        slot holds the item for position pos
 * - seq == pos + Capacity slot was consumed and is free for the next lap
 *
 * Producers claim a position with CAS only when its slot is free, so a
 * full buffer rejects the push without consuming a position. Every
 * claimed position is therefore published, and the consumer never waits
 * on a gap.
 *
 * @tparam T         Element type (must be move-constructible)
 * @tparam Capacity  Buffer size. Must be a power of 2.
 */
template <typename T, size_t Capacity = 4096>
class MPSCRingBuffer {
    static_assert(Capacity > 0 && (Capacity & (Capacity - 1)) == 0,
                  "Capacity must be a positive power of 2");
    static_assert(std::is_move_constructible_v<T>,
                  "T must be move-constructible");

public:
    MPSCRingBuffer() {
        for (size_t i = 0; i < Capacity; ++i) {
            slots_[i].seq.store(i, std::memory_order_relaxed);
        }
    }

    MPSCRingBuffer(const MPSCRingBuffer&) = delete;
    MPSCRingBuffer& operator=(const MPSCRingBuffer&) = delete;
    MPSCRingBuffer(MPSCRingBuffer&&) = delete;
    MPSCRingBuffer& operator=(MPSCRingBuffer&&) = delete;

    /**
     * @brief Enqueue an item (any thread)
     * @return false if the buffer is full; the item is dropped and counted
     */
    [[nodiscard]] bool try_push(T item) {
        size_t pos = write_pos_.load(std::memory_order_relaxed);
        Slot* slot = nullptr;

        while (true) {
            slot = &slots_[pos & kMask];
            const size_t seq = slot->seq.load(std::memory_order_acquire);
            const auto diff = static_cast<std::ptrdiff_t>(seq) - static_cast<std::ptrdiff_t>(pos);

            if (diff == 0) {
                if (write_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                    break;
                }
            } else if (diff < 0) {
                overflow_count_.fetch_add(1, std::memory_order_relaxed);
                return false;
            } else {
                pos = write_pos_.load(std::memory_order_relaxed);
            }
        }

        slot->data.emplace(std::move(item));
        slot->seq.store(pos + 1, std::memory_order_release);
        return true;
    }

    /**
     * @brief Drain up to max_count published items in position order
     * (consumer thread only)
     */
    size_t drain(std::vector<T>& batch, size_t max_count) {
        size_t count = 0;
        while (count < max_count) {
            Slot& slot = slots_[read_pos_ & kMask];
            if (slot.seq.load(std::memory_order_acquire) != read_pos_ + 1) {
                break;  // Empty, or the next producer has not published yet
            }

            batch.emplace_back(std::move(*slot.data));
            slot.data.reset();
            slot.seq.store(read_pos_ + Capacity, std::memory_order_release);

            ++read_pos_;
            ++count;
        }
        return count;
    }

    /// Positions claimed so far; every one of them will be published
    [[nodiscard]] uint64_t claimed() const noexcept {
        return write_pos_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint64_t overflow_count() const noexcept {
        return overflow_count_.load(std::memory_order_relaxed);
    }

    static constexpr size_t capacity() noexcept {
        return Capacity;
    }

private:
    static constexpr size_t kMask = Capacity - 1;

    struct alignas(64) Slot {
        std::atomic<size_t> seq{0};
        std::optional<T> data;
    };

    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) size_t read_pos_{0};  // Consumer only
    alignas(64) std::atomic<uint64_t> overflow_count_{0};

    std::array<Slot, Capacity> slots_;
};

} // namespace promptguard
