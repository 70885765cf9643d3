/*
===============================================================================
 sync::SyncService - Reconnect, Status & Pull
===============================================================================

Covered:
D1 Cloud reconnects with backoff, 10 retries then none
D2 Connection status notified once per transition
D3 LAN-only operation reports connected via LAN
D4 request_sync only on an open socket, automatic on connect
D5 Detailed status surface
D6 Cloud transport errors reported to consumers
D7 Broadcasts during an outage spend the retry budget

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <string>

#include "common/harness/sync.hpp"

using namespace std::chrono_literals;
using sync::test::SyncHarness;
using sync::DeviceMode;
using sync::SyncPath;
using sync::ErrorPath;


void test_retry_budget() {
    std::cout << "[TEST] D1 10 retries then none\n";
    SyncHarness h{DeviceMode::Kds};
    TEST_CHECK(h.initialize() == Error::None);
    h.open_cloud();

    WebSocketUnderTest::set_connect_result(Error::ConnectionFailed);
    TEST_CHECK(WebSocketUnderTest::emit_drop());
    h.poll();
    TEST_CHECK(h.service->cloud().reconnect_pending());

    // 1 + 2 + 4 + 8 + 16 + 30 x 5 seconds
    h.advance_stepwise(181s, 1s);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 11);
    TEST_CHECK(!h.service->cloud().reconnect_pending());
    TEST_CHECK(h.service->cloud_state() == ConnectionState::Disconnected);

    h.advance_stepwise(10min, 10s);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 11);

    // LAN keeps the terminal online
    TEST_CHECK(h.service->connection_status() == ConnectionState::Connected);
    TEST_CHECK(h.service->active_sync_path() == SyncPath::Lan);

    // A broadcast starts a fresh attempt
    WebSocketUnderTest::set_connect_result(Error::None);
    h.service->broadcast_staff_removed("s1");
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 12);
    TEST_CHECK(h.service->cloud_state() == ConnectionState::Connecting);

    std::cout << "[TEST] OK\n";
}

void test_status_transitions() {
    std::cout << "[TEST] D2 Status notified once per transition\n";
    SyncHarness h{DeviceMode::Kds, false};

    TEST_CHECK(h.initialize() == Error::None);
    TEST_CHECK(h.connection_changes.size() == 1);
    TEST_CHECK(h.connection_changes[0].first == ConnectionState::Connecting);
    TEST_CHECK(h.connection_changes[0].second == SyncPath::None);

    h.open_cloud();
    TEST_CHECK(h.connection_changes.size() == 2);
    TEST_CHECK(h.connection_changes[1].first == ConnectionState::Connected);
    TEST_CHECK(h.connection_changes[1].second == SyncPath::Cloud);

    // Frames and heartbeats do not notify
    h.cloud_frame(json::frame::order_created("o1"));
    h.advance(30s);
    TEST_CHECK(h.connection_changes.size() == 2);

    // Error + Close: one transition
    TEST_CHECK(WebSocketUnderTest::emit_drop());
    h.poll();
    TEST_CHECK(h.connection_changes.size() == 3);
    TEST_CHECK(h.connection_changes[2].first == ConnectionState::Disconnected);
    TEST_CHECK(h.connection_changes[2].second == SyncPath::None);

    h.advance(1s);
    TEST_CHECK(h.connection_changes.size() == 4);
    TEST_CHECK(h.connection_changes[3].first == ConnectionState::Connecting);

    h.open_cloud();
    TEST_CHECK(h.connection_changes.size() == 5);
    TEST_CHECK(h.connection_changes[4].second == SyncPath::Cloud);
    TEST_CHECK(h.service->cloud().reconnect_attempts() == 0);

    std::cout << "[TEST] OK\n";
}

void test_lan_only() {
    std::cout << "[TEST] D3 LAN-only operation\n";
    SyncHarness h{DeviceMode::Kds};
    WebSocketUnderTest::set_connect_result(Error::ConnectionFailed);

    TEST_CHECK(h.initialize() == Error::None);
    TEST_CHECK(h.service->cloud_state() == ConnectionState::Disconnected);
    TEST_CHECK(h.service->is_lan_connected());
    TEST_CHECK(!h.service->is_cloud_connected());
    TEST_CHECK(h.service->connection_status() == ConnectionState::Connected);
    TEST_CHECK(h.service->active_sync_path() == SyncPath::Lan);
    TEST_CHECK(h.connection_changes.back().first == ConnectionState::Connected);
    TEST_CHECK(h.connection_changes.back().second == SyncPath::Lan);

    // Orders keep flowing over LAN
    h.lan_event(SyncHarness::lan_order("o1"));
    TEST_CHECK(h.created.size() == 1);

    // Losing the host leaves nothing connected
    h.lan_event(lan::event::Disconnected{});
    TEST_CHECK(!h.service->is_lan_connected());
    TEST_CHECK(h.service->active_sync_path() == SyncPath::None);
    TEST_CHECK(h.connection_changes.back().second == SyncPath::None);

    // Host back
    lan::event::Connected back;
    back.status.is_connected = true;
    back.status.server_address = "192.168.1.10:8765";
    h.lan_event(back);
    TEST_CHECK(h.service->active_sync_path() == SyncPath::Lan);

    std::cout << "[TEST] OK\n";
}

void test_request_sync() {
    std::cout << "[TEST] D4 request_sync\n";
    SyncHarness h{DeviceMode::Kds};
    TEST_CHECK(h.initialize() == Error::None);

    TEST_CHECK(!h.service->request_sync());
    TEST_CHECK(WebSocketUnderTest::sent().empty());

    h.open_cloud();
    TEST_CHECK(WebSocketUnderTest::sent_count(R"({"type":"request_sync"})") == 1);

    TEST_CHECK(h.service->request_sync());
    TEST_CHECK(WebSocketUnderTest::sent_count(R"({"type":"request_sync"})") == 2);

    // Every reconnect asks again
    TEST_CHECK(WebSocketUnderTest::emit_drop());
    h.poll();
    h.advance(1s);
    h.open_cloud();
    TEST_CHECK(WebSocketUnderTest::sent_count(R"({"type":"request_sync"})") == 3);

    std::cout << "[TEST] OK\n";
}

void test_detailed_status() {
    std::cout << "[TEST] D5 Detailed status\n";
    SyncHarness h{DeviceMode::Pos};
    TEST_CHECK(h.initialize() == Error::None);
    h.lan.push_client_connected("kds-1");
    h.poll();
    h.open_cloud();

    const auto s = h.service->detailed_status();
    TEST_CHECK(s.cloud.status == ConnectionState::Connected);
    TEST_CHECK(s.cloud.reconnect_attempts == 0);
    TEST_CHECK(s.lan.is_server);
    TEST_CHECK(s.lan.server_running);
    TEST_CHECK(s.lan.connected_clients == 1);
    TEST_CHECK(s.active_path == SyncPath::Both);
    TEST_CHECK(s.to_json() ==
        "{\"cloud\":{\"status\":\"connected\",\"reconnectAttempts\":0},"
        "\"lan\":{\"status\":\"connected\",\"isServer\":true,\"serverRunning\":true,\"connectedClients\":1},"
        "\"activePath\":\"both\"}");

    // Retry counter visible while the cloud is down
    WebSocketUnderTest::set_connect_result(Error::ConnectionFailed);
    TEST_CHECK(WebSocketUnderTest::emit_drop());
    h.poll();
    h.advance(1s);
    h.advance(2s);
    TEST_CHECK(h.service->detailed_status().cloud.reconnect_attempts == 2);
    TEST_CHECK(h.service->detailed_status().active_path == SyncPath::Lan);

    std::cout << "[TEST] OK\n";
}

void test_cloud_errors() {
    std::cout << "[TEST] D6 Cloud transport errors reported\n";
    SyncHarness h{DeviceMode::Kds, false};
    TEST_CHECK(h.initialize() == Error::None);
    h.open_cloud();

    TEST_CHECK(WebSocketUnderTest::emit_drop(Error::RemoteClosed));
    h.poll();
    TEST_CHECK(h.errors.size() == 1);
    TEST_CHECK(h.errors[0].path == ErrorPath::Cloud);
    TEST_CHECK(h.errors[0].code == Error::RemoteClosed);

    // Failed retry
    WebSocketUnderTest::set_connect_result(Error::HandshakeFailed);
    h.advance(1s);
    TEST_CHECK(h.errors.size() == 2);
    TEST_CHECK(h.errors[1].code == Error::HandshakeFailed);

    // Invalid relay base
    sync::SyncConfig config;
    config.cloud_ws_base = "ftp://relay.test";
    SyncHarness b{DeviceMode::Kds, false};
    b.make_service(config);
    TEST_CHECK(b.initialize() == Error::InvalidUrl);
    TEST_CHECK(b.service->initialized());
    TEST_CHECK(b.errors.size() == 1);
    TEST_CHECK(b.errors[0].path == ErrorPath::Cloud);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 0);

    std::cout << "[TEST] OK\n";
}

void test_broadcasts_spend_retry_budget() {
    std::cout << "[TEST] D7 Broadcasts during an outage spend the retry budget\n";
    SyncHarness h{DeviceMode::Kds};
    TEST_CHECK(h.initialize() == Error::None);
    h.open_cloud();

    WebSocketUnderTest::set_connect_result(Error::ConnectionFailed);
    TEST_CHECK(WebSocketUnderTest::emit_drop());
    h.poll();
    TEST_CHECK(h.service->cloud().reconnect_pending());

    schema::order::ItemReady ready;
    ready.order_id = "o1";
    ready.item_id = "i1";

    // Faster than any backoff delay, so only broadcasts start attempts
    for (int i = 0; i < 400; ++i) {
        h.advance(900ms);
        h.service->broadcast_item_ready(ready);
    }
    h.advance(5s);

    TEST_CHECK(h.service->cloud().reconnect_attempts() == 10);
    TEST_CHECK(!h.service->cloud().reconnect_pending());
    TEST_CHECK(h.service->cloud().last_retry_delay() == 30000ms);
    TEST_CHECK(h.service->cloud_telemetry().retry_exhausted_total.load() >= 1);
    TEST_CHECK(h.service->cloud_state() == ConnectionState::Disconnected);
    TEST_CHECK(h.service->pending_sends() == 0);
    TEST_CHECK(h.service->telemetry().cloud_sends_dropped_total.load() == 400);

    // Once quiet, the channel stays quiet
    const int calls = WebSocketUnderTest::connect_calls();
    h.advance_stepwise(10min, 10s);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == calls);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_retry_budget();
    test_status_transitions();
    test_lan_only();
    test_request_sync();
    test_detailed_status();
    test_cloud_errors();
    test_broadcasts_spend_retry_budget();

    std::cout << "\n[SYNC SERVICE STATUS TESTS PASSED]\n";
    return 0;
}
