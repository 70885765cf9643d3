#pragma once

#include <atomic>
#include <cstdint>


namespace lcr::metrics::atomic {

// Cumulative counter. Relaxed ordering: readers only need an eventually
// consistent total, never a happens-before edge.
template <typename T>
class counter {
public:
    counter() = default;

    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    void inc(T n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }
    [[nodiscard]] T load() const noexcept { return value_.load(std::memory_order_relaxed); }

private:
    alignas(64) std::atomic<T> value_{0};
};

using counter32 = counter<std::uint32_t>;
using counter64 = counter<std::uint64_t>;

} // namespace lcr::metrics::atomic
