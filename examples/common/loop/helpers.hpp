#pragma once

#include <chrono>
#include <thread>


namespace tablesync::examples::loop {

// Idle strategy for a poll() loop. A burst of empty polls is tolerated
// (events tend to arrive in clusters), then the thread yields, then it
// sleeps. Sleeping keeps the node cheap between the millisecond-scale
// timers the sync service arms.
class IdleBackoff {
public:
    explicit IdleBackoff(int spin_limit = 64, int yield_limit = 128,
                         std::chrono::milliseconds sleep = std::chrono::milliseconds(5)) noexcept
        : spin_limit_(spin_limit), yield_limit_(yield_limit), sleep_(sleep) {}

    void operator()(bool did_work) {
        if (did_work) {
            idle_ = 0;
            return;
        }
        ++idle_;
        if (idle_ <= spin_limit_) {
            return;
        }
        if (idle_ <= yield_limit_) {
            std::this_thread::yield();
            return;
        }
        std::this_thread::sleep_for(sleep_);
    }

private:
    int spin_limit_;
    int yield_limit_;
    std::chrono::milliseconds sleep_;
    int idle_ = 0;
};

} // namespace tablesync::examples::loop
