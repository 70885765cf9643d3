#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <unordered_map>
#include <utility>

#include "tablesync/core/timer/clock.hpp"
#include "lcr/log/logger.hpp"


namespace tablesync::core::timer {

/*
===============================================================================
 tablesync::core::timer::Scheduler
===============================================================================

Single owner of every deferred action in a sync service instance.

- schedule_after(delay, task) arms a one-shot timer and returns its id
- cancel(id) disarms it; cancelling an unknown or fired id is a no-op
- poll() runs every task whose deadline is <= clock.now(), earliest first,
  ties broken by scheduling order
- clear() disarms everything synchronously; no task runs afterwards

Tasks run on the poll() caller thread. A task may schedule or cancel other
timers, including clearing the scheduler.
===============================================================================
*/

using TimerId = std::uint64_t;
inline constexpr TimerId INVALID_TIMER = 0;

template <ClockConcept Clock>
class Scheduler {
public:
    using Task = std::function<void()>;

    explicit Scheduler(const Clock& clock) noexcept
        : clock_(clock)
    {}

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    [[nodiscard]]
    inline TimerId schedule_after(Duration delay, Task task) {
        if (delay < Duration::zero()) {
            delay = Duration::zero();
        }
        const TimerId id = ++next_id_;
        const TimePoint due = clock_.now() + delay;
        queue_.emplace(Key{due, id}, std::move(task));
        index_.emplace(id, due);
        return id;
    }

    inline bool cancel(TimerId id) noexcept {
        auto it = index_.find(id);
        if (it == index_.end()) {
            return false;
        }
        queue_.erase(Key{it->second, id});
        index_.erase(it);
        return true;
    }

    // Runs due tasks. Returns the number of tasks executed.
    inline std::size_t poll() {
        std::size_t fired = 0;
        const TimePoint now = clock_.now();
        while (!queue_.empty()) {
            auto it = queue_.begin();
            if (it->first.due > now) {
                break;
            }
            Task task = std::move(it->second);
            index_.erase(it->first.id);
            queue_.erase(it);
            ++fired;
            if (task) {
                task();
            }
        }
        return fired;
    }

    inline void clear() noexcept {
        if (!queue_.empty()) {
            TS_TRACE("[TIMER] Cancelling " << queue_.size() << " pending timer(s)");
        }
        queue_.clear();
        index_.clear();
    }

    [[nodiscard]] inline bool is_pending(TimerId id) const noexcept {
        return index_.find(id) != index_.end();
    }

    [[nodiscard]] inline std::size_t pending() const noexcept {
        return queue_.size();
    }

    // Deadline of the earliest armed timer, or TimePoint::max() when idle.
    [[nodiscard]] inline TimePoint next_due() const noexcept {
        return queue_.empty() ? TimePoint::max() : queue_.begin()->first.due;
    }

    [[nodiscard]] inline const Clock& clock() const noexcept {
        return clock_;
    }

private:
    struct Key {
        TimePoint due;
        TimerId id;

        bool operator<(const Key& other) const noexcept {
            return due != other.due ? due < other.due : id < other.id;
        }
    };

    const Clock& clock_;
    std::map<Key, Task> queue_;
    std::unordered_map<TimerId, TimePoint> index_;
    TimerId next_id_{INVALID_TIMER};
};

} // namespace tablesync::core::timer
