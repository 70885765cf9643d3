#pragma once

#include <chrono>
#include <cstdint>


namespace tablesync::core::transport {

// -----------------------------------------------------------------------------
// Reconnect policy for the cloud channel.
//
//   delay(n) = min(base * 2^n, max) + jitter,   jitter in [0, jitter_max)
//
// n is the number of retries already fired since the last successful open.
// After max_attempts retries without an open, no further timer is armed.
// -----------------------------------------------------------------------------
struct ReconnectPolicy {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds max{30000};
    std::chrono::milliseconds jitter_max{1000};
    std::uint32_t max_attempts = 10;
};

// Deterministic part of the delay (no jitter)
[[nodiscard]]
inline constexpr std::chrono::milliseconds backoff_base_delay(const ReconnectPolicy& policy, std::uint32_t attempt) noexcept {
    // Exponent capped so the shift never overflows; the cap dominates long before.
    const std::uint32_t exp = attempt > 20 ? 20 : attempt;
    const auto raw = policy.base.count() * (std::int64_t{1} << exp);
    return std::chrono::milliseconds{raw < policy.max.count() ? raw : policy.max.count()};
}

// jitter is clamped into [0, jitter_max)
[[nodiscard]]
inline constexpr std::chrono::milliseconds backoff_delay(const ReconnectPolicy& policy, std::uint32_t attempt,
                                                         std::chrono::milliseconds jitter) noexcept {
    if (jitter < std::chrono::milliseconds::zero()) {
        jitter = std::chrono::milliseconds::zero();
    }
    if (policy.jitter_max > std::chrono::milliseconds::zero() && jitter >= policy.jitter_max) {
        jitter = policy.jitter_max - std::chrono::milliseconds{1};
    }
    if (policy.jitter_max <= std::chrono::milliseconds::zero()) {
        jitter = std::chrono::milliseconds::zero();
    }
    return backoff_base_delay(policy, attempt) + jitter;
}

static_assert(backoff_base_delay(ReconnectPolicy{}, 0) == std::chrono::milliseconds{1000});
static_assert(backoff_base_delay(ReconnectPolicy{}, 4) == std::chrono::milliseconds{16000});
static_assert(backoff_base_delay(ReconnectPolicy{}, 5) == std::chrono::milliseconds{30000});

} // namespace tablesync::core::transport
