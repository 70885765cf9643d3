/*
===============================================================================
 sync::SyncService - Lifecycle & Roles
===============================================================================

Covered:
A1 Display terminal: cloud connect + LAN client with its device type
A2 POS terminal hosts the LAN server
A3 LAN unavailable: cloud only, no LAN calls, no errors
A4 No LAN host found: LAN error reported, cloud unaffected
A5 Empty tenant rejected
A6 shutdown(): socket closed, LAN left, timers cancelled, callbacks detached
A7 Re-initialize and destruction

===============================================================================
*/

#include <chrono>
#include <iostream>

#include "common/harness/sync.hpp"

using namespace std::chrono_literals;
using sync::test::SyncHarness;
using sync::DeviceMode;
using sync::LanRole;
using sync::SyncPath;
using sync::ErrorPath;


void test_display_terminal() {
    std::cout << "[TEST] A1 Display terminal joins LAN as client\n";
    SyncHarness h{DeviceMode::Bds};

    TEST_CHECK(h.initialize() == Error::None);
    TEST_CHECK(h.service->initialized());
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);
    TEST_CHECK(WebSocketUnderTest::last_url() == "wss://relay.test:443/ws/orders/rest-1");
    TEST_CHECK(h.service->cloud_state() == ConnectionState::Connecting);

    TEST_CHECK(h.service->role().lan_role == LanRole::Client);
    TEST_CHECK(!h.service->role().is_server);
    TEST_CHECK(h.lan.connect_calls == 1);
    TEST_CHECK(h.lan.start_server_calls == 0);
    TEST_CHECK(h.lan.last_device_type == lan::DeviceType::Bds);
    TEST_CHECK(h.lan.last_tenant == "rest-1");
    TEST_CHECK(h.service->is_lan_connected());
    TEST_CHECK(h.service->active_sync_path() == SyncPath::Lan);

    h.open_cloud();
    TEST_CHECK(h.service->active_sync_path() == SyncPath::Both);
    TEST_CHECK(h.service->connection_status() == ConnectionState::Connected);
    TEST_CHECK(h.errors.empty());

    std::cout << "[TEST] OK\n";
}

void test_pos_hosts_server() {
    std::cout << "[TEST] A2 POS terminal hosts the LAN server\n";
    SyncHarness h{DeviceMode::Pos};

    TEST_CHECK(h.initialize() == Error::None);
    TEST_CHECK(h.service->role().lan_role == LanRole::Server);
    TEST_CHECK(h.service->role().is_server);
    TEST_CHECK(h.lan.start_server_calls == 1);
    TEST_CHECK(h.lan.connect_calls == 0);
    TEST_CHECK(h.lan.serving);

    const auto status = h.service->detailed_status();
    TEST_CHECK(status.lan.is_server);
    TEST_CHECK(status.lan.server_running);
    TEST_CHECK(status.lan.status == ConnectionState::Connected);
    TEST_CHECK(status.lan.connected_clients == 0);

    h.lan.push_client_connected("kds-1");
    h.lan.push_client_connected("bds-1", lan::DeviceType::Bds);
    h.poll();
    TEST_CHECK(h.service->detailed_status().lan.connected_clients == 2);

    h.lan_event(lan::event::ClientDisconnected{"kds-1"});
    TEST_CHECK(h.service->detailed_status().lan.connected_clients == 1);

    // Manager terminals host too
    SyncHarness m{DeviceMode::Manager};
    TEST_CHECK(m.initialize() == Error::None);
    TEST_CHECK(m.service->role().lan_role == LanRole::Server);

    std::cout << "[TEST] OK\n";
}

void test_lan_unavailable() {
    std::cout << "[TEST] A3 LAN unavailable: cloud only\n";
    SyncHarness h{DeviceMode::Pos, false};

    TEST_CHECK(h.initialize() == Error::None);
    TEST_CHECK(h.service->role().lan_role == LanRole::None);
    TEST_CHECK(h.service->role().is_server);
    TEST_CHECK(h.lan.start_server_calls == 0);
    TEST_CHECK(h.lan.connect_calls == 0);
    TEST_CHECK(h.errors.empty());
    TEST_CHECK(h.service->lan_state() == ConnectionState::Disconnected);

    h.open_cloud();
    TEST_CHECK(h.service->active_sync_path() == SyncPath::Cloud);

    std::cout << "[TEST] OK\n";
}

void test_no_lan_host() {
    std::cout << "[TEST] A4 No LAN host found\n";
    SyncHarness h{DeviceMode::Kds};
    h.lan.host_found = false;

    TEST_CHECK(h.initialize() == Error::None);
    TEST_CHECK(h.lan.connect_calls == 1);
    TEST_CHECK(h.errors.size() == 1);
    TEST_CHECK(h.errors[0].path == ErrorPath::Lan);
    TEST_CHECK(h.errors[0].code == Error::ConnectionFailed);
    TEST_CHECK(h.service->lan_state() == ConnectionState::Disconnected);
    TEST_CHECK(h.service->cloud_state() == ConnectionState::Connecting);

    // Server start failure is reported the same way
    SyncHarness p{DeviceMode::Pos};
    p.lan.start_result = Error::TransportFailure;
    TEST_CHECK(p.initialize() == Error::None);
    TEST_CHECK(p.errors.size() == 1);
    TEST_CHECK(p.errors[0].path == ErrorPath::Lan);
    TEST_CHECK(p.errors[0].code == Error::TransportFailure);
    TEST_CHECK(!p.service->detailed_status().lan.server_running);

    std::cout << "[TEST] OK\n";
}

void test_empty_tenant() {
    std::cout << "[TEST] A5 Empty tenant rejected\n";
    SyncHarness h;

    TEST_CHECK(h.initialize("") == Error::InvalidState);
    TEST_CHECK(!h.service->initialized());
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 0);
    TEST_CHECK(h.lan.connect_calls == 0);

    std::cout << "[TEST] OK\n";
}

void test_shutdown() {
    std::cout << "[TEST] A6 shutdown() releases everything\n";
    SyncHarness h{DeviceMode::Kds};

    TEST_CHECK(h.initialize() == Error::None);
    h.open_cloud();
    h.cloud_frame(json::frame::order_created("o1"));
    TEST_CHECK(h.created.size() == 1);
    TEST_CHECK(h.service->board().active_count() == 1);
    TEST_CHECK(h.service->scheduler().pending() > 0);   // heartbeat + dedup expiry

    h.service->shutdown();
    TEST_CHECK(!h.service->initialized());
    TEST_CHECK(WebSocketUnderTest::close_calls() == 1);
    TEST_CHECK(WebSocketUnderTest::current() == nullptr);
    TEST_CHECK(h.lan.disconnect_calls == 1);
    TEST_CHECK(h.service->scheduler().pending() == 0);
    TEST_CHECK(h.service->dedup().empty());
    TEST_CHECK(h.service->board().active_count() == 0);
    TEST_CHECK(h.service->cloud_state() == ConnectionState::Disconnected);
    TEST_CHECK(h.service->lan_state() == ConnectionState::Disconnected);
    TEST_CHECK(h.service->role().tenant_id.empty());

    // Nothing fires afterwards
    h.reset_records();
    h.lan.push(SyncHarness::lan_order("o2"));
    h.advance(10min);
    TEST_CHECK(h.created.empty());
    TEST_CHECK(h.connection_changes.empty());
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);

    // Idempotent
    h.service->shutdown();
    TEST_CHECK(WebSocketUnderTest::close_calls() == 1);

    std::cout << "[TEST] OK\n";
}

void test_reinitialize_and_destroy() {
    std::cout << "[TEST] A7 Re-initialize and destruction\n";
    SyncHarness h{DeviceMode::Pos};

    TEST_CHECK(h.initialize("rest-1") == Error::None);
    h.open_cloud();
    TEST_CHECK(h.initialize("rest-2") == Error::None);

    TEST_CHECK(h.lan.stop_server_calls == 1);
    TEST_CHECK(h.lan.start_server_calls == 2);
    TEST_CHECK(h.lan.last_tenant == "rest-2");
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);
    TEST_CHECK(WebSocketUnderTest::last_url() == "wss://relay.test:443/ws/orders/rest-2");
    TEST_CHECK(h.service->role().tenant_id == "rest-2");

    // Old registry was replaced, not stacked
    h.reset_records();
    h.open_cloud();
    h.cloud_frame(json::frame::order_created("o1"));
    TEST_CHECK(h.created.size() == 1);

    h.destroy_service();
    TEST_CHECK(h.lan.stop_server_calls == 2);
    TEST_CHECK(WebSocketUnderTest::current() == nullptr);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_display_terminal();
    test_pos_hosts_server();
    test_lan_unavailable();
    test_no_lan_host();
    test_empty_tenant();
    test_shutdown();
    test_reinitialize_and_destroy();

    std::cout << "\n[SYNC SERVICE LIFECYCLE TESTS PASSED]\n";
    return 0;
}
