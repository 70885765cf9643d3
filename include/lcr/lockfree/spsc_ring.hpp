// -----------------------------------------------------------------------------
// Bounded single-producer / single-consumer ring
//
// Hands transport events from an I/O thread to the poll thread, and queues
// edge-triggered signals when producer and consumer share a thread.
//
//     spsc_ring<Signal, 16> signals;
//     if (!signals.push(Signal::Connected)) { /* full */ }
//     Signal sig;
//     while (signals.pop(sig)) { ... }
//
// Capacity is a power of two. One slot stays free, so Capacity - 1 items fit.
// -----------------------------------------------------------------------------
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <utility>


namespace lcr::lockfree {

template <typename T, std::size_t Capacity>
class spsc_ring {
    static_assert(Capacity >= 2 && (Capacity & (Capacity - 1)) == 0,
                  "spsc_ring capacity must be a power of two");

    static constexpr std::size_t MASK = Capacity - 1;

public:
    spsc_ring() = default;

    spsc_ring(const spsc_ring&) = delete;
    spsc_ring& operator=(const spsc_ring&) = delete;

    // Producer side. Returns false when the ring is full.
    template <typename U>
    [[nodiscard]] bool push(U&& item) noexcept {
        const std::size_t write = write_.load(std::memory_order_relaxed);
        const std::size_t next  = (write + 1) & MASK;
        if (next == read_.load(std::memory_order_acquire)) {
            return false;
        }
        slots_[write] = std::forward<U>(item);
        write_.store(next, std::memory_order_release);
        return true;
    }

    // Consumer side. Returns false when the ring is empty.
    [[nodiscard]] bool pop(T& out) noexcept {
        const std::size_t read = read_.load(std::memory_order_relaxed);
        if (read == write_.load(std::memory_order_acquire)) {
            return false;
        }
        out = std::move(slots_[read]);
        read_.store((read + 1) & MASK, std::memory_order_release);
        return true;
    }

    [[nodiscard]] bool empty() const noexcept {
        return read_.load(std::memory_order_acquire) == write_.load(std::memory_order_acquire);
    }

private:
    std::array<T, Capacity> slots_{};
    alignas(64) std::atomic<std::size_t> write_{0};
    alignas(64) std::atomic<std::size_t> read_{0};
};

} // namespace lcr::lockfree
