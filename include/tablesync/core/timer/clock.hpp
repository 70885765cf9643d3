#pragma once

#include <chrono>
#include <concepts>


namespace tablesync::core::timer {

/*
===============================================================================
 Clock sources
===============================================================================

Every timer in the engine (reconnect delay, dedup expiry, send-retry polls,
heartbeat) reads time through a Clock. Production code uses SteadyClock;
tests use ManualClock and advance it explicitly, so no test ever sleeps.
===============================================================================
*/

using TimePoint = std::chrono::steady_clock::time_point;
using Duration  = std::chrono::milliseconds;

template<class C>
concept ClockConcept = requires(const C& c) {
    { c.now() } noexcept -> std::same_as<TimePoint>;
};


struct SteadyClock {
    [[nodiscard]]
    inline TimePoint now() const noexcept {
        return std::chrono::steady_clock::now();
    }
};


class ManualClock {
public:
    [[nodiscard]]
    inline TimePoint now() const noexcept {
        return now_;
    }

    inline void advance(Duration d) noexcept {
        now_ += d;
    }

    inline void advance_ms(long long ms) noexcept {
        now_ += Duration{ms};
    }

private:
    TimePoint now_{std::chrono::hours{1}};
};

static_assert(ClockConcept<SteadyClock>);
static_assert(ClockConcept<ManualClock>);

} // namespace tablesync::core::timer
