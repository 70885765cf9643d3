#pragma once

#include <variant>

#include "tablesync/core/protocol/schema/order.hpp"
#include "tablesync/core/protocol/schema/staff.hpp"
#include "tablesync/core/protocol/schema/floorplan.hpp"
#include "tablesync/core/protocol/schema/service_request.hpp"
#include "tablesync/core/protocol/schema/system.hpp"


namespace tablesync::core::protocol {

// ===============================================
// INBOUND MESSAGE (closed set)
// ===============================================
// Adding an alternative breaks every dispatcher that does not handle it.
using Message = std::variant<
    std::monostate,
    schema::order::Created,
    schema::order::StatusUpdate,
    schema::order::ItemStatusUpdate,
    schema::order::SyncState,
    schema::order::QrCreated,
    schema::order::ItemReady,
    schema::staff::Sync,
    schema::staff::Added,
    schema::staff::Updated,
    schema::staff::Removed,
    schema::floorplan::Sync,
    schema::floorplan::SectionAdded,
    schema::floorplan::SectionRemoved,
    schema::floorplan::TableAdded,
    schema::floorplan::TableRemoved,
    schema::floorplan::TableStatusUpdated,
    schema::floorplan::StaffAssigned,
    schema::service::Created,
    schema::service::Acknowledged,
    schema::service::Resolved,
    schema::system::SyncRequested,
    schema::system::Pong
>;

// Overload set helper for std::visit
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace tablesync::core::protocol
