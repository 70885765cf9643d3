// ============================================================================
// tablesync_node
//
// Joins a tenant's order relay as one terminal and prints every synchronized
// event until Ctrl+C (or --duration) ends the session.
//
// Usage:
//   tablesync_node --tenant rest-42 --mode kds
//   TABLESYNC_ORDERS_WS_URL=ws://localhost:8787 tablesync_node -t demo -l debug
// ============================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>

#include "tablesync/core/timer/clock.hpp"
#include "tablesync/core/transport/beast/websocket.hpp"
#include "tablesync/lan/unavailable.hpp"
#include "tablesync/sync/service.hpp"

#include "common/cli/node_params.hpp"
#include "common/loop/helpers.hpp"

using namespace tablesync;

namespace {

std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

} // namespace

int main(int argc, char** argv) {
    lcr::log::Logger::instance().enable_color(true);

    const auto params = examples::cli::configure(argc, argv, "tablesync node: restaurant order sync over cloud and LAN");
    params.dump("=== Node Parameters ===", std::cout);

    std::signal(SIGINT, on_signal);

    core::timer::SteadyClock clock;
    lan::Unavailable lan;
    sync::SyncService<core::transport::beast::WebSocket, lan::Unavailable> service{lan, clock, params.to_config()};

    std::size_t orders = 0;
    std::size_t status_updates = 0;
    std::size_t errors = 0;

    sync::SyncCallbacks callbacks;
    callbacks.on_order_created = [&](const sync::schema::order::Order& order, const sync::schema::order::KitchenOrder& ko) {
        ++orders;
        std::cout << " -> ORDER " << order.order_id << " #" << ko.order_number
                  << " table=" << lcr::to_string(ko.table_number)
                  << " items=" << ko.items.size() << std::endl;
    };
    callbacks.on_qr_order_created = [](const sync::schema::order::Order&, const sync::schema::order::TableInfo& table,
                                       const sync::schema::order::KitchenOrder& ko) {
        std::cout << " -> QR ORDER #" << ko.order_number << " from " << table.section_name
                  << " table " << lcr::to_string(table.table_number) << std::endl;
    };
    callbacks.on_order_status_update = [&](const sync::schema::order::StatusUpdate& update) {
        ++status_updates;
        std::cout << " -> STATUS " << update.order_id << " = " << update.status << std::endl;
    };
    callbacks.on_item_ready = [](const sync::schema::order::ItemReady& ready) {
        std::cout << " -> READY " << ready.item_name << " for #" << ready.order_number << std::endl;
    };
    callbacks.on_sync_state = [](const std::vector<sync::schema::order::KitchenOrder>& active) {
        std::cout << " -> SNAPSHOT " << active.size() << " active order(s)" << std::endl;
    };
    callbacks.on_staff_sync = [](const std::vector<sync::schema::staff::Member>& staff) {
        std::cout << " -> STAFF SYNC " << staff.size() << " member(s)" << std::endl;
    };
    callbacks.on_floor_plan_sync = [](const sync::schema::floorplan::Sync& plan) {
        std::cout << " -> FLOOR PLAN " << plan.sections.size() << " section(s), "
                  << plan.tables.size() << " table(s)" << std::endl;
    };
    callbacks.on_service_request = [](const sync::schema::service::Request& request) {
        std::cout << " -> SERVICE REQUEST " << request.id << " (" << request.type << ")" << std::endl;
    };
    callbacks.on_sync_requested = [](const std::string& requester, const std::string& device_type) {
        std::cout << " -> SYNC REQUESTED by " << requester << " (" << device_type << ")" << std::endl;
    };
    callbacks.on_connection_change = [](core::transport::ConnectionState status, sync::SyncPath path) {
        std::cout << "[tablesync] Connection " << core::transport::to_string(status)
                  << " via " << sync::to_string(path) << std::endl;
    };
    callbacks.on_error = [&](const sync::SyncError& error) {
        ++errors;
        std::cout << "[tablesync] " << sync::to_string(error.path) << " error: " << error.message << std::endl;
    };

    if (service.initialize(params.tenant, std::move(callbacks)) != core::transport::Error::None) {
        std::cerr << "Failed to initialize sync for tenant " << params.tenant << std::endl;
        return EXIT_FAILURE;
    }

    const auto start = std::chrono::steady_clock::now();
    const auto duration = std::chrono::seconds(params.duration_sec);
    examples::loop::IdleBackoff idle;
    while (running.load()) {
        if (params.duration_sec > 0 && std::chrono::steady_clock::now() - start >= duration) {
            break;
        }
        idle(service.poll() > 0);
    }

    std::cout << "\n=== Session Summary ===\n"
              << "  Orders received : " << orders << "\n"
              << "  Status updates  : " << status_updates << "\n"
              << "  Errors          : " << errors << "\n"
              << "  Active on board : " << service.board().active_count() << "\n"
              << service.detailed_status() << "\n";

#ifdef TABLESYNC_ENABLE_TELEMETRY_L1
    service.telemetry().debug_dump(std::cout);
    service.cloud_telemetry().debug_dump(std::cout);
#endif

    service.shutdown();
    return EXIT_SUCCESS;
}
