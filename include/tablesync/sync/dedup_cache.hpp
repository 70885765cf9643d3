#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>

#include "tablesync/core/timer/scheduler.hpp"
#include "lcr/log/logger.hpp"


namespace tablesync::sync {

/*
===============================================================================
 tablesync::sync::DedupCache
===============================================================================

Time-bounded set of recently applied order ids.

- insert(id) adds the id with its own expiry timer and returns true; an id
  already present returns false and keeps its first expiry
- mark(id) adds the id, or restarts its expiry if present (used for
  orders this device broadcast itself)
- Entries leave the set when their timer fires; an id seen again after
  expiry is new
- clear() cancels every expiry timer

Timers live in the service Scheduler, so a ManualClock drives expiry in
tests.
===============================================================================
*/
template <core::timer::ClockConcept Clock>
class DedupCache {
public:
    DedupCache(core::timer::Scheduler<Clock>& scheduler, std::chrono::milliseconds ttl) noexcept
        : scheduler_(scheduler)
        , ttl_(ttl)
    {}

    DedupCache(const DedupCache&) = delete;
    DedupCache& operator=(const DedupCache&) = delete;

    ~DedupCache() {
        clear();
    }

    [[nodiscard]]
    inline bool contains(std::string_view id) const {
        return entries_.find(std::string{id}) != entries_.end();
    }

    // Returns false if the id is already present
    [[nodiscard]]
    inline bool insert(std::string_view id) {
        std::string key{id};
        if (entries_.find(key) != entries_.end()) {
            return false;
        }
        arm_(std::move(key));
        return true;
    }

    inline void mark(std::string_view id) {
        std::string key{id};
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            scheduler_.cancel(it->second);
            entries_.erase(it);
        }
        arm_(std::move(key));
    }

    inline void clear() noexcept {
        for (const auto& [id, timer] : entries_) {
            scheduler_.cancel(timer);
        }
        entries_.clear();
    }

    [[nodiscard]] inline std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] inline std::chrono::milliseconds ttl() const noexcept { return ttl_; }

private:
    core::timer::Scheduler<Clock>& scheduler_;
    std::chrono::milliseconds ttl_;
    std::unordered_map<std::string, core::timer::TimerId> entries_;

private:
    inline void arm_(std::string key) {
        const auto timer = scheduler_.schedule_after(ttl_, [this, key]() {
            entries_.erase(key);
            TS_TRACE("[DEDUP] Expired: " << key);
        });
        entries_.emplace(std::move(key), timer);
    }
};

} // namespace tablesync::sync
