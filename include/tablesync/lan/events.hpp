#pragma once

#include <string>
#include <variant>

#include "tablesync/core/protocol/schema/order.hpp"
#include "tablesync/lan/types.hpp"


namespace tablesync::lan {

// ===============================================
// LAN EVENTS (drained by the sync service)
// ===============================================
namespace event {

// A peer broadcast an order
using OrderCreated = core::protocol::schema::order::Created;

struct OrderStatusUpdate {
    std::string order_id;
    std::string status;
};

// Active orders pushed by the host after a client joins
using SyncState = core::protocol::schema::order::SyncState;

// Client side: link to the host established
struct Connected {
    ClientStatus status;
};

// Client side: link to the host lost
struct Disconnected {
};

// Server side: a device joined
struct ClientConnected {
    ClientInfo client;
};

// Server side: a device left
struct ClientDisconnected {
    std::string client_id;
};

} // namespace event

using Event = std::variant<
    std::monostate,
    event::OrderCreated,
    event::OrderStatusUpdate,
    event::SyncState,
    event::Connected,
    event::Disconnected,
    event::ClientConnected,
    event::ClientDisconnected
>;

} // namespace tablesync::lan
