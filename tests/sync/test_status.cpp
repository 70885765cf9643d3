/*
===============================================================================
 sync status aggregation - Unit Tests
===============================================================================

Covered:
T1 aggregate_status over every cloud/lan combination
T2 active_path over every cloud/lan combination
T3 DetailedStatus JSON surface

===============================================================================
*/

#include <iostream>
#include <sstream>
#include <string>

#include "tablesync/sync/status.hpp"
#include "common/test_check.hpp"

using namespace tablesync::sync;

static constexpr ConnectionState D = ConnectionState::Disconnected;
static constexpr ConnectionState G = ConnectionState::Connecting;
static constexpr ConnectionState C = ConnectionState::Connected;


void test_aggregate() {
    std::cout << "[TEST] T1 aggregate_status combinations\n";
    TEST_CHECK(aggregate_status(D, D) == D);
    TEST_CHECK(aggregate_status(D, G) == G);
    TEST_CHECK(aggregate_status(D, C) == C);
    TEST_CHECK(aggregate_status(G, D) == G);
    TEST_CHECK(aggregate_status(G, G) == G);
    TEST_CHECK(aggregate_status(G, C) == C);
    TEST_CHECK(aggregate_status(C, D) == C);
    TEST_CHECK(aggregate_status(C, G) == C);
    TEST_CHECK(aggregate_status(C, C) == C);
    std::cout << "[TEST] OK\n";
}

void test_path() {
    std::cout << "[TEST] T2 active_path combinations\n";
    TEST_CHECK(active_path(D, D) == SyncPath::None);
    TEST_CHECK(active_path(D, G) == SyncPath::None);
    TEST_CHECK(active_path(D, C) == SyncPath::Lan);
    TEST_CHECK(active_path(G, D) == SyncPath::None);
    TEST_CHECK(active_path(G, G) == SyncPath::None);
    TEST_CHECK(active_path(G, C) == SyncPath::Lan);
    TEST_CHECK(active_path(C, D) == SyncPath::Cloud);
    TEST_CHECK(active_path(C, G) == SyncPath::Cloud);
    TEST_CHECK(active_path(C, C) == SyncPath::Both);
    TEST_CHECK(to_string(SyncPath::Both) == "both");
    std::cout << "[TEST] OK\n";
}

void test_detailed_json() {
    std::cout << "[TEST] T3 DetailedStatus JSON\n";
    DetailedStatus s;
    s.cloud.status = C;
    s.cloud.reconnect_attempts = 3;
    s.lan.status = C;
    s.lan.is_server = true;
    s.lan.server_running = true;
    s.lan.connected_clients = 2;
    s.active_path = SyncPath::Both;

    TEST_CHECK(s.to_json() ==
        "{\"cloud\":{\"status\":\"connected\",\"reconnectAttempts\":3},"
        "\"lan\":{\"status\":\"connected\",\"isServer\":true,\"serverRunning\":true,\"connectedClients\":2},"
        "\"activePath\":\"both\"}");

    DetailedStatus idle;
    TEST_CHECK(idle.to_json() ==
        "{\"cloud\":{\"status\":\"disconnected\",\"reconnectAttempts\":0},"
        "\"lan\":{\"status\":\"disconnected\",\"isServer\":false,\"serverRunning\":false,\"connectedClients\":0},"
        "\"activePath\":\"none\"}");

    std::ostringstream os;
    os << s;
    TEST_CHECK(os.str().find("path=both") != std::string::npos);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_aggregate();
    test_path();
    test_detailed_json();

    std::cout << "\n[STATUS TESTS PASSED]\n";
    return 0;
}
