/*
===============================================================================
 transport::CloudChannel - Group B Reconnect Tests
===============================================================================

Scope:
------
Exponential-backoff reconnection after transport closes.

Covered:
B1 Retry delays follow min(1s * 2^n, 30s)
B2 At most ten retries without an open, then RetriesExhausted
B3 A successful open resets the attempt budget
B4 Error events are informational; Close drives the state
B5 connect() after exhaustion starts a fresh cycle
B6 connect() ahead of an armed retry spends that retry

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <vector>

#include "common/harness/cloud.hpp"

using namespace std::chrono_literals;
using test::CloudHarness;


// Lets the armed retry fire, then fails the attempt it started
static void fail_next_retry(CloudHarness& h) {
    h.advance(h.channel->last_retry_delay());
    TEST_CHECK(h.channel->state() == ConnectionState::Connecting);
    TEST_CHECK(WebSocketUnderTest::emit_close());
    h.poll();
}


// -----------------------------------------------------------------------------
// Group B1: Delay sequence
// -----------------------------------------------------------------------------
void test_delay_sequence() {
    std::cout << "[TEST] Group B1: retry delays double up to the cap\n";
    CloudHarness h;
    h.start();

    TEST_CHECK(WebSocketUnderTest::emit_close());
    h.poll();

    std::vector<long long> delays;
    delays.push_back(h.channel->last_retry_delay().count());
    for (int i = 0; i < 6; ++i) {
        fail_next_retry(h);
        delays.push_back(h.channel->last_retry_delay().count());
    }
    TEST_CHECK((delays == std::vector<long long>{1000, 2000, 4000, 8000, 16000, 30000, 30000}));

    // Not a millisecond early
    const int before = WebSocketUnderTest::connect_calls();
    h.advance(29999ms);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == before);
    h.advance(1ms);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == before + 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B2: Attempt budget
// -----------------------------------------------------------------------------
void test_retry_budget() {
    std::cout << "[TEST] Group B2: ten retries, then no further timer\n";
    CloudHarness h;
    h.start();

    TEST_CHECK(WebSocketUnderTest::emit_close());
    h.poll();
    for (int i = 0; i < 10; ++i) {
        TEST_CHECK(h.exhausted_signals == 0);
        fail_next_retry(h);
    }

    TEST_CHECK(WebSocketUnderTest::connect_calls() == 11);  // initial + 10 retries
    TEST_CHECK(h.retry_signals == 10);
    TEST_CHECK(h.exhausted_signals == 1);
    TEST_CHECK(h.channel->reconnect_attempts() == 10);
    TEST_CHECK(!h.channel->reconnect_pending());
    TEST_CHECK(h.channel->state() == ConnectionState::Disconnected);

    // Not fatal, just quiet
    h.advance(10min);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 11);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B3: Open resets the budget
// -----------------------------------------------------------------------------
void test_open_resets_attempts() {
    std::cout << "[TEST] Group B3: open resets the attempt counter\n";
    CloudHarness h;
    h.start();

    TEST_CHECK(WebSocketUnderTest::emit_close());
    h.poll();
    fail_next_retry(h);
    fail_next_retry(h);
    TEST_CHECK(h.channel->reconnect_attempts() == 2);

    h.advance(h.channel->last_retry_delay());
    TEST_CHECK(WebSocketUnderTest::emit_open());
    h.poll();
    TEST_CHECK(h.channel->is_open());
    TEST_CHECK(h.channel->reconnect_attempts() == 0);
    TEST_CHECK(h.channel->epoch() == 1);

    // Next drop starts again from the base delay
    TEST_CHECK(WebSocketUnderTest::emit_close());
    h.poll();
    TEST_CHECK(h.channel->last_retry_delay() == 1000ms);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B4: Error then Close
// -----------------------------------------------------------------------------
void test_error_then_close() {
    std::cout << "[TEST] Group B4: error is informational, close drives state\n";
    CloudHarness h;
    h.open();
    h.reset_counters();

    TEST_CHECK(WebSocketUnderTest::emit_error(Error::Timeout));
    h.poll();
    TEST_CHECK(h.error_signals == 1);
    TEST_CHECK(h.channel->is_open());
    TEST_CHECK(h.channel->last_error() == Error::Timeout);

    TEST_CHECK(WebSocketUnderTest::emit_close());
    h.poll();
    TEST_CHECK(h.disconnected_signals == 1);
    TEST_CHECK(h.retry_signals == 1);
    TEST_CHECK(h.channel->state() == ConnectionState::Disconnected);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B5: Manual connect after exhaustion
// -----------------------------------------------------------------------------
void test_connect_after_exhaustion() {
    std::cout << "[TEST] Group B5: connect() after exhaustion\n";
    ReconnectPolicy policy;
    policy.max_attempts = 2;
    CloudHarness h{policy};
    h.start();

    TEST_CHECK(WebSocketUnderTest::emit_close());
    h.poll();
    fail_next_retry(h);
    fail_next_retry(h);
    TEST_CHECK(h.exhausted_signals == 1);

    TEST_CHECK(h.channel->connect() == Error::None);
    TEST_CHECK(WebSocketUnderTest::emit_open());
    h.poll();
    TEST_CHECK(h.channel->is_open());
    TEST_CHECK(h.channel->reconnect_attempts() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B6: Early connect() spends the armed retry
// -----------------------------------------------------------------------------
void test_early_connect_counts() {
    std::cout << "[TEST] Group B6: connect() ahead of the retry timer\n";
    CloudHarness h;
    h.start();

    WebSocketUnderTest::set_connect_result(Error::ConnectionFailed);
    TEST_CHECK(WebSocketUnderTest::emit_close());
    h.poll();
    TEST_CHECK(h.channel->reconnect_pending());
    TEST_CHECK(h.channel->reconnect_attempts() == 0);

    // Always earlier than the armed delay, so no timer ever fires
    for (int i = 1; i <= 10; ++i) {
        h.advance(900ms);
        TEST_CHECK(h.channel->connect() == Error::ConnectionFailed);
        h.poll();
        TEST_CHECK(h.channel->reconnect_attempts() == static_cast<std::uint32_t>(i));
    }

    TEST_CHECK(h.exhausted_signals == 1);
    TEST_CHECK(!h.channel->reconnect_pending());
    TEST_CHECK(h.channel->last_retry_delay() == 30000ms);

    // Further manual attempts do not re-arm the timer
    TEST_CHECK(h.channel->connect() == Error::ConnectionFailed);
    h.poll();
    TEST_CHECK(!h.channel->reconnect_pending());
    TEST_CHECK(h.channel->reconnect_attempts() == 10);
    TEST_CHECK(h.exhausted_signals == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Debug);

    test_delay_sequence();
    test_retry_budget();
    test_open_resets_attempts();
    test_error_then_close();
    test_connect_after_exhaustion();
    test_early_connect_counts();

    std::cout << "\n[GROUP B - CLOUD CHANNEL RECONNECT TESTS PASSED]\n";
    return 0;
}
