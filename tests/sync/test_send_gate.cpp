/*
===============================================================================
 sync::SendGate - Unit Tests
===============================================================================

Covered:
G1 Ready channel: task runs synchronously
G2 Channel opens during the wait: task runs on the first poll that sees it
G3 Channel never opens: task runs after the last poll (6 x 500ms)
G4 cancel_all() drops pending tasks without running them

===============================================================================
*/

#include <chrono>
#include <iostream>

#include "tablesync/core/timer/clock.hpp"
#include "tablesync/core/timer/scheduler.hpp"
#include "tablesync/sync/broadcaster.hpp"
#include "common/test_check.hpp"

using namespace tablesync;
using namespace std::chrono_literals;

using Clock = core::timer::ManualClock;
using Gate  = sync::SendGate<Clock>;


struct GateFixture {
    Clock clock;
    core::timer::Scheduler<Clock> scheduler{clock};
    Gate gate{scheduler, sync::SendRetryPolicy{}};

    bool open = false;
    int runs = 0;
    bool open_at_run = false;

    void submit() {
        gate.run_when([this]() { return open; }, [this]() {
            ++runs;
            open_at_run = open;
        });
    }

    void step(int ms) {
        clock.advance_ms(ms);
        scheduler.poll();
    }
};


void test_ready_now() {
    std::cout << "[TEST] G1 Ready channel runs synchronously\n";
    GateFixture f;
    f.open = true;
    f.submit();
    TEST_CHECK(f.runs == 1);
    TEST_CHECK(f.open_at_run);
    TEST_CHECK(f.gate.pending() == 0);
    TEST_CHECK(f.scheduler.pending() == 0);
    std::cout << "[TEST] OK\n";
}

void test_opens_during_wait() {
    std::cout << "[TEST] G2 Opens during the wait\n";
    GateFixture f;
    f.submit();
    TEST_CHECK(f.runs == 0);
    TEST_CHECK(f.gate.pending() == 1);

    f.step(500);
    TEST_CHECK(f.runs == 0);

    f.open = true;
    f.step(499);
    TEST_CHECK(f.runs == 0);
    f.step(1);
    TEST_CHECK(f.runs == 1);
    TEST_CHECK(f.open_at_run);
    TEST_CHECK(f.gate.pending() == 0);
    std::cout << "[TEST] OK\n";
}

void test_never_opens() {
    std::cout << "[TEST] G3 Never opens: runs after the last poll\n";
    GateFixture f;
    f.submit();

    for (int i = 0; i < 5; ++i) {
        f.step(500);
        TEST_CHECK(f.runs == 0);
    }
    f.step(500);
    TEST_CHECK(f.runs == 1);
    TEST_CHECK(!f.open_at_run);
    TEST_CHECK(f.gate.pending() == 0);
    TEST_CHECK(f.scheduler.pending() == 0);

    f.step(5000);
    TEST_CHECK(f.runs == 1);
    std::cout << "[TEST] OK\n";
}

void test_cancel_all() {
    std::cout << "[TEST] G4 cancel_all() drops pending tasks\n";
    GateFixture f;
    f.submit();
    f.submit();
    TEST_CHECK(f.gate.pending() == 2);

    f.gate.cancel_all();
    TEST_CHECK(f.gate.pending() == 0);
    TEST_CHECK(f.scheduler.pending() == 0);

    f.open = true;
    f.step(5000);
    TEST_CHECK(f.runs == 0);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_ready_now();
    test_opens_during_wait();
    test_never_opens();
    test_cancel_all();

    std::cout << "\n[SEND GATE TESTS PASSED]\n";
    return 0;
}
