#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "tablesync/core/protocol/schema/order.hpp"
#include "tablesync/core/protocol/schema/staff.hpp"
#include "tablesync/core/protocol/schema/floorplan.hpp"
#include "tablesync/core/protocol/schema/service_request.hpp"
#include "tablesync/core/protocol/schema/system.hpp"
#include "tablesync/core/transport/error.hpp"
#include "tablesync/sync/status.hpp"
#include "lcr/event/emitter.hpp"


namespace tablesync::sync {

namespace schema = core::protocol::schema;

// ===============================================
// ERROR REPORTED TO CONSUMERS
// ===============================================
enum class ErrorPath : std::uint8_t {
    Cloud,
    Lan
};

[[nodiscard]]
inline constexpr std::string_view to_string(ErrorPath p) noexcept {
    return p == ErrorPath::Cloud ? "cloud" : "lan";
}

struct SyncError {
    ErrorPath path = ErrorPath::Cloud;
    core::transport::Error code = core::transport::Error::None;
    std::string message;
};

/*
===============================================================================
 tablesync::sync::SyncEvents
===============================================================================

One typed emitter per domain event. Any number of subscribers per event;
subscribers are called on the poll() thread, in subscription order.

Order events fire after the kitchen board has been updated and only once per
order id within the dedup window. connection_change fires once per transport
state transition with the freshly aggregated (status, path) pair.
===============================================================================
*/
struct SyncEvents {
    // --- Orders ---
    lcr::event::emitter<const schema::order::Order&, const schema::order::KitchenOrder&> order_created;
    lcr::event::emitter<const schema::order::StatusUpdate&> order_status_update;
    lcr::event::emitter<const schema::order::ItemStatusUpdate&> item_status_update;
    lcr::event::emitter<const std::vector<schema::order::KitchenOrder>&> sync_state;
    lcr::event::emitter<const schema::order::Order&, const schema::order::TableInfo&,
                        const schema::order::KitchenOrder&> qr_order_created;
    lcr::event::emitter<const schema::order::ItemReady&> item_ready;

    // --- Staff ---
    lcr::event::emitter<const std::vector<schema::staff::Member>&> staff_sync;
    lcr::event::emitter<const schema::staff::Member&> staff_added;
    lcr::event::emitter<const std::string&, const schema::RawJson&> staff_updated;
    lcr::event::emitter<const std::string&> staff_removed;

    // --- Floor plan ---
    lcr::event::emitter<const schema::floorplan::Sync&> floor_plan_sync;
    lcr::event::emitter<const schema::floorplan::Section&> section_added;
    lcr::event::emitter<const std::string&> section_removed;
    lcr::event::emitter<const schema::floorplan::Table&> table_added;
    lcr::event::emitter<const std::string&> table_removed;
    lcr::event::emitter<const std::string&, const std::string&> table_status_updated;
    lcr::event::emitter<const schema::floorplan::Assignment&> staff_assigned;

    // --- Service requests ---
    lcr::event::emitter<const schema::service::Request&> service_request;
    lcr::event::emitter<const std::string&, const std::string&, const std::string&> service_request_acknowledged;
    lcr::event::emitter<const std::string&> service_request_resolved;

    // --- Control ---
    lcr::event::emitter<const std::string&, const std::string&> sync_requested;
    lcr::event::emitter<ConnectionState, SyncPath> connection_change;
    lcr::event::emitter<const SyncError&> error;

    inline void clear() noexcept {
        order_created.clear();
        order_status_update.clear();
        item_status_update.clear();
        sync_state.clear();
        qr_order_created.clear();
        item_ready.clear();
        staff_sync.clear();
        staff_added.clear();
        staff_updated.clear();
        staff_removed.clear();
        floor_plan_sync.clear();
        section_added.clear();
        section_removed.clear();
        table_added.clear();
        table_removed.clear();
        table_status_updated.clear();
        staff_assigned.clear();
        service_request.clear();
        service_request_acknowledged.clear();
        service_request_resolved.clear();
        sync_requested.clear();
        connection_change.clear();
        error.clear();
    }
};

// ===============================================
// CALLBACK REGISTRY (one optional handler per event)
// ===============================================
// Bound onto SyncEvents by SyncService::initialize(); a later initialize()
// replaces the previous registry.
struct SyncCallbacks {
    std::function<void(const schema::order::Order&, const schema::order::KitchenOrder&)> on_order_created;
    std::function<void(const schema::order::StatusUpdate&)> on_order_status_update;
    std::function<void(const schema::order::ItemStatusUpdate&)> on_item_status_update;
    std::function<void(const std::vector<schema::order::KitchenOrder>&)> on_sync_state;
    std::function<void(const schema::order::Order&, const schema::order::TableInfo&,
                       const schema::order::KitchenOrder&)> on_qr_order_created;
    std::function<void(const schema::order::ItemReady&)> on_item_ready;

    std::function<void(const std::vector<schema::staff::Member>&)> on_staff_sync;
    std::function<void(const schema::staff::Member&)> on_staff_added;
    std::function<void(const std::string&, const schema::RawJson&)> on_staff_updated;
    std::function<void(const std::string&)> on_staff_removed;

    std::function<void(const schema::floorplan::Sync&)> on_floor_plan_sync;
    std::function<void(const schema::floorplan::Section&)> on_section_added;
    std::function<void(const std::string&)> on_section_removed;
    std::function<void(const schema::floorplan::Table&)> on_table_added;
    std::function<void(const std::string&)> on_table_removed;
    std::function<void(const std::string&, const std::string&)> on_table_status_updated;
    std::function<void(const schema::floorplan::Assignment&)> on_staff_assigned;

    std::function<void(const schema::service::Request&)> on_service_request;
    std::function<void(const std::string&, const std::string&, const std::string&)> on_service_request_acknowledged;
    std::function<void(const std::string&)> on_service_request_resolved;

    std::function<void(const std::string&, const std::string&)> on_sync_requested;
    std::function<void(ConnectionState, SyncPath)> on_connection_change;
    std::function<void(const SyncError&)> on_error;
};

// Emitter subscriptions made for one SyncCallbacks registry
class CallbackBinding {
public:
    inline void bind(SyncEvents& events, const SyncCallbacks& cb) {
        unbind();
        events_ = &events;
        add_(events.order_created, cb.on_order_created);
        add_(events.order_status_update, cb.on_order_status_update);
        add_(events.item_status_update, cb.on_item_status_update);
        add_(events.sync_state, cb.on_sync_state);
        add_(events.qr_order_created, cb.on_qr_order_created);
        add_(events.item_ready, cb.on_item_ready);
        add_(events.staff_sync, cb.on_staff_sync);
        add_(events.staff_added, cb.on_staff_added);
        add_(events.staff_updated, cb.on_staff_updated);
        add_(events.staff_removed, cb.on_staff_removed);
        add_(events.floor_plan_sync, cb.on_floor_plan_sync);
        add_(events.section_added, cb.on_section_added);
        add_(events.section_removed, cb.on_section_removed);
        add_(events.table_added, cb.on_table_added);
        add_(events.table_removed, cb.on_table_removed);
        add_(events.table_status_updated, cb.on_table_status_updated);
        add_(events.staff_assigned, cb.on_staff_assigned);
        add_(events.service_request, cb.on_service_request);
        add_(events.service_request_acknowledged, cb.on_service_request_acknowledged);
        add_(events.service_request_resolved, cb.on_service_request_resolved);
        add_(events.sync_requested, cb.on_sync_requested);
        add_(events.connection_change, cb.on_connection_change);
        add_(events.error, cb.on_error);
    }

    inline void unbind() noexcept {
        for (auto& release : releases_) {
            release();
        }
        releases_.clear();
        events_ = nullptr;
    }

    [[nodiscard]] inline bool bound() const noexcept { return events_ != nullptr; }
    [[nodiscard]] inline std::size_t size() const noexcept { return releases_.size(); }

private:
    SyncEvents* events_ = nullptr;
    std::vector<std::function<void()>> releases_;

private:
    template <typename... Args, typename Fn>
    inline void add_(lcr::event::emitter<Args...>& em, const Fn& fn) {
        if (!fn) {
            return;
        }
        const auto token = em.subscribe(fn);
        releases_.push_back([&em, token]() { em.unsubscribe(token); });
    }
};

} // namespace tablesync::sync
