#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>

#include "tablesync/core/timer/scheduler.hpp"
#include "tablesync/sync/config.hpp"
#include "lcr/log/logger.hpp"


namespace tablesync::sync {

// ===============================================
// OUTCOME OF ONE BROADCAST
// ===============================================
struct BroadcastResult {
    bool cloud = false;      // frame handed to an open cloud socket
    std::size_t lan = 0;     // LAN clients reached
};

using BroadcastCompletion = std::function<void(const BroadcastResult&)>;

/*
===============================================================================
 tablesync::sync::SendGate
===============================================================================

Defers an outbound send until the cloud channel is open, for a bounded time.

    run_when(ready, task)

- ready() true now   -> task runs synchronously
- otherwise          -> ready() is polled every `interval`, at most
                        `max_polls` times; task runs on the first poll that
                        sees ready() true, or after the last poll regardless

The task decides what to do with a still-closed channel (drop, never queue).
cancel_all() drops every pending task without running it.
===============================================================================
*/
template <core::timer::ClockConcept Clock>
class SendGate {
public:
    using Ready = std::function<bool()>;
    using Task  = std::function<void()>;

    SendGate(core::timer::Scheduler<Clock>& scheduler, SendRetryPolicy policy) noexcept
        : scheduler_(scheduler)
        , policy_(policy)
    {}

    SendGate(const SendGate&) = delete;
    SendGate& operator=(const SendGate&) = delete;

    ~SendGate() {
        cancel_all();
    }

    inline void run_when(Ready ready, Task task) {
        if (!ready || ready() || policy_.max_polls == 0) {
            task();
            return;
        }
        const std::uint64_t id = ++next_id_;
        Pending& p = pending_[id];
        p.ready = std::move(ready);
        p.task = std::move(task);
        arm_(id);
    }

    inline void cancel_all() noexcept {
        if (!pending_.empty()) {
            TS_DEBUG("[SYNC] Dropping " << pending_.size() << " pending send(s)");
        }
        for (const auto& [id, p] : pending_) {
            scheduler_.cancel(p.timer);
        }
        pending_.clear();
    }

    [[nodiscard]] inline std::size_t pending() const noexcept { return pending_.size(); }
    [[nodiscard]] inline const SendRetryPolicy& policy() const noexcept { return policy_; }

private:
    struct Pending {
        Ready ready;
        Task task;
        std::uint32_t polls = 0;
        core::timer::TimerId timer = core::timer::INVALID_TIMER;
    };

    core::timer::Scheduler<Clock>& scheduler_;
    SendRetryPolicy policy_;
    std::map<std::uint64_t, Pending> pending_;
    std::uint64_t next_id_ = 0;

private:
    inline void arm_(std::uint64_t id) {
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return;
        }
        it->second.timer = scheduler_.schedule_after(policy_.interval, [this, id]() {
            on_tick_(id);
        });
    }

    inline void on_tick_(std::uint64_t id) {
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return;
        }
        Pending& p = it->second;
        p.timer = core::timer::INVALID_TIMER;
        ++p.polls;
        const bool ready = p.ready();
        if (!ready && p.polls < policy_.max_polls) {
            arm_(id);
            return;
        }
        TS_TRACE("[SYNC] Send gate released after " << p.polls << " poll(s) (cloud " << (ready ? "open" : "closed") << ")");
        Task task = std::move(p.task);
        pending_.erase(it);
        task();
    }
};

} // namespace tablesync::sync
