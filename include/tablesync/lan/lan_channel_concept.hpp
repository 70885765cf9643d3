/*
===============================================================================
LanChannelConcept
===============================================================================

Contract of the local-network collaborator (host server or client link).
Discovery, sockets and the server itself live behind it.

  • available() is false on hosts without LAN support; nothing else is called
  • start_server() binds the local server and reports its address
  • connect_as_client() locates a host for the tenant; `status` is filled
    only when a host answered
  • broadcast_order() returns the number of clients reached
  • poll_event() drains inbound events in arrival order

All operations are synchronous from the caller's side and never throw.
Instances are owned by the caller and passed to the service by reference.
===============================================================================
*/
#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>

#include "tablesync/core/transport/error.hpp"
#include "tablesync/core/protocol/schema/order.hpp"
#include "tablesync/lan/events.hpp"
#include "tablesync/lan/types.hpp"
#include "lcr/optional.hpp"


namespace tablesync::lan {

template<class L>
concept LanChannelConcept =
    requires(
        L lan,
        const L clan,
        std::string_view tenant,
        std::string& address,
        DeviceType device_type,
        lcr::optional<ClientStatus>& status,
        const core::protocol::schema::order::Order& order,
        const core::protocol::schema::order::KitchenOrder& kitchen_order,
        std::string_view order_id,
        std::string_view order_status,
        Event& ev
    )
{
    { clan.available() } noexcept -> std::same_as<bool>;

    // Server role
    { lan.start_server(tenant, address) } noexcept -> std::same_as<core::transport::Error>;
    { lan.stop_server() } noexcept -> std::same_as<core::transport::Error>;

    // Client role
    { lan.connect_as_client(device_type, tenant, status) } noexcept -> std::same_as<core::transport::Error>;
    { lan.disconnect() } noexcept -> std::same_as<core::transport::Error>;

    // Fan-out (server role)
    { lan.broadcast_order(order, kitchen_order) } noexcept -> std::same_as<std::size_t>;
    { lan.broadcast_order_status(order_id, order_status) } noexcept -> std::same_as<core::transport::Error>;

    // Event draining
    { lan.poll_event(ev) } noexcept -> std::same_as<bool>;
};

} // namespace tablesync::lan
