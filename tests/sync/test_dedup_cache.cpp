/*
===============================================================================
 sync::DedupCache - Unit Tests
===============================================================================

Covered:
D1 insert() accepts a new id once
D2 Entries expire after the TTL; the id is new again
D3 A repeated insert keeps the first expiry
D4 mark() restarts the expiry
D5 clear() and destruction cancel every expiry timer

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <memory>

#include "tablesync/core/timer/clock.hpp"
#include "tablesync/core/timer/scheduler.hpp"
#include "tablesync/sync/dedup_cache.hpp"
#include "common/test_check.hpp"

using namespace tablesync;
using namespace std::chrono_literals;

using Clock = core::timer::ManualClock;
using Cache = sync::DedupCache<Clock>;


void test_insert_once() {
    std::cout << "[TEST] D1 insert() accepts a new id once\n";
    Clock clock;
    core::timer::Scheduler<Clock> scheduler{clock};
    Cache cache{scheduler, 300000ms};

    TEST_CHECK(cache.insert("o1"));
    TEST_CHECK(!cache.insert("o1"));
    TEST_CHECK(cache.insert("o2"));
    TEST_CHECK(cache.contains("o1"));
    TEST_CHECK(cache.size() == 2);
    TEST_CHECK(scheduler.pending() == 2);

    std::cout << "[TEST] OK\n";
}

void test_expiry() {
    std::cout << "[TEST] D2 Entries expire after the TTL\n";
    Clock clock;
    core::timer::Scheduler<Clock> scheduler{clock};
    Cache cache{scheduler, 300000ms};

    TEST_CHECK(cache.insert("o1"));

    clock.advance(299999ms);
    scheduler.poll();
    TEST_CHECK(cache.contains("o1"));
    TEST_CHECK(!cache.insert("o1"));

    clock.advance(1ms);
    TEST_CHECK(scheduler.poll() == 1);
    TEST_CHECK(!cache.contains("o1"));
    TEST_CHECK(cache.empty());

    TEST_CHECK(cache.insert("o1"));

    std::cout << "[TEST] OK\n";
}

void test_repeat_keeps_expiry() {
    std::cout << "[TEST] D3 Repeated insert keeps the first expiry\n";
    Clock clock;
    core::timer::Scheduler<Clock> scheduler{clock};
    Cache cache{scheduler, 1000ms};

    TEST_CHECK(cache.insert("o1"));
    clock.advance(600ms);
    scheduler.poll();
    TEST_CHECK(!cache.insert("o1"));

    clock.advance(400ms);
    scheduler.poll();
    TEST_CHECK(!cache.contains("o1"));

    std::cout << "[TEST] OK\n";
}

void test_mark_restarts() {
    std::cout << "[TEST] D4 mark() restarts the expiry\n";
    Clock clock;
    core::timer::Scheduler<Clock> scheduler{clock};
    Cache cache{scheduler, 1000ms};

    cache.mark("o1");
    TEST_CHECK(cache.contains("o1"));

    clock.advance(600ms);
    scheduler.poll();
    cache.mark("o1");
    TEST_CHECK(scheduler.pending() == 1);

    clock.advance(600ms);
    scheduler.poll();
    TEST_CHECK(cache.contains("o1"));   // 1200ms after first mark, 600ms after second

    clock.advance(400ms);
    scheduler.poll();
    TEST_CHECK(!cache.contains("o1"));

    std::cout << "[TEST] OK\n";
}

void test_clear_cancels() {
    std::cout << "[TEST] D5 clear() and destruction cancel every timer\n";
    Clock clock;
    core::timer::Scheduler<Clock> scheduler{clock};

    {
        Cache cache{scheduler, 1000ms};
        TEST_CHECK(cache.insert("a"));
        TEST_CHECK(cache.insert("b"));
        cache.clear();
        TEST_CHECK(cache.empty());
        TEST_CHECK(scheduler.pending() == 0);

        TEST_CHECK(cache.insert("c"));
        TEST_CHECK(scheduler.pending() == 1);
    }
    TEST_CHECK(scheduler.pending() == 0);

    clock.advance(5000ms);
    TEST_CHECK(scheduler.poll() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_insert_once();
    test_expiry();
    test_repeat_keeps_expiry();
    test_mark_restarts();
    test_clear_cancels();

    std::cout << "\n[DEDUP CACHE TESTS PASSED]\n";
    return 0;
}
