#pragma once

#include <string>
#include <string_view>

#include <simdjson.h>

#include "tablesync/core/protocol/message.hpp"
#include "tablesync/core/protocol/message_type.hpp"
#include "tablesync/core/protocol/parser/result.hpp"
#include "tablesync/core/protocol/parser/helpers.hpp"
#include "tablesync/core/protocol/parser/order.hpp"
#include "tablesync/core/protocol/parser/staff.hpp"
#include "tablesync/core/protocol/parser/floorplan.hpp"
#include "tablesync/core/protocol/parser/service_request.hpp"
#include "tablesync/core/protocol/parser/system.hpp"
#include "lcr/log/logger.hpp"


namespace tablesync::core::protocol::parser {

/*
================================================================================
TableSync Wire Parsing Architecture
================================================================================

Every frame received from the cloud relay or a LAN peer is a JSON object
carrying a string "type" discriminator. Parsing is split in four layers:

-------------------------------------------------------------------------------
1) Router (Message Dispatch)
-------------------------------------------------------------------------------
  • Parses the raw frame into a DOM
  • Reads "type" and selects the message parser
  • Fills exactly one alternative of protocol::Message

No field-level parsing and no domain logic.

-------------------------------------------------------------------------------
2) Message Parsers (parser/order.hpp, staff.hpp, floorplan.hpp, ...)
-------------------------------------------------------------------------------
  • Validate required vs optional fields of one message type
  • Log parsing failures with actionable diagnostics
  • Populate schema structures

-------------------------------------------------------------------------------
3) Adapters (parser/adapters.hpp)
-------------------------------------------------------------------------------
  • Normalize producer inconsistencies (numeric vs string identifiers)
  • Build payload structures, keeping the verbatim JSON for forwarding

-------------------------------------------------------------------------------
4) Helpers (parser/helpers.hpp)
-------------------------------------------------------------------------------
  • Structural JSON checks on primitives; never log

A frame that fails at any layer leaves `out` as std::monostate and is
dropped by the caller. Malformed frames never abort the connection.

================================================================================
*/

class Router {
public:
    Router() = default;

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Main entry point
    [[nodiscard]]
    inline Result parse(std::string_view raw_msg, Message& out) noexcept {
        out = std::monostate{};
        last_type_ = MessageType::Unknown;

        simdjson::dom::element root;
        auto error = parser_.parse(raw_msg.data(), raw_msg.size()).get(root);
        if (error) {
            TS_WARN("[ROUTER] JSON parse error: " << error << " in message: " << raw_msg);
            return Result::InvalidJson;
        }
        if (helper::require_object(root) != Result::Parsed) {
            TS_WARN("[ROUTER] Root is not a JSON object: " << raw_msg);
            return Result::InvalidJson;
        }
        std::string type;
        if (helper::parse_string_required(root, "type", type) != Result::Parsed) {
            TS_WARN("[ROUTER] Field 'type' missing or invalid -> ignore message.");
            return Result::InvalidSchema;
        }
        last_type_ = message_type_from_string(type);
        return route_(last_type_, type, root, out);
    }

    // Type of the last frame routed (Unknown if unreadable)
    [[nodiscard]]
    inline MessageType last_type() const noexcept {
        return last_type_;
    }

private:
    simdjson::dom::parser parser_;
    MessageType last_type_{MessageType::Unknown};

private:
    template <typename Schema, typename ParseFn>
    [[nodiscard]]
    static inline Result emplace_(const simdjson::dom::element& root, Message& out, ParseFn parse_fn) noexcept {
        Schema msg{};
        const auto r = parse_fn(root, msg);
        if (r == Result::Parsed) {
            out = std::move(msg);
        }
        return r;
    }

    [[nodiscard]]
    inline Result route_(MessageType type, std::string_view name, const simdjson::dom::element& root, Message& out) noexcept {
        namespace s = schema;
        switch (type) {
            // --- Orders ---
            case MessageType::OrderCreated:
                return emplace_<s::order::Created>(root, out, order::parse_created);
            case MessageType::OrderStatusUpdate:
                return emplace_<s::order::StatusUpdate>(root, out, order::parse_status_update);
            case MessageType::ItemStatusUpdate:
                return emplace_<s::order::ItemStatusUpdate>(root, out, order::parse_item_status_update);
            case MessageType::SyncState:
                return emplace_<s::order::SyncState>(root, out, order::parse_sync_state);
            case MessageType::QrOrderCreated:
                return emplace_<s::order::QrCreated>(root, out, order::parse_qr_created);
            case MessageType::ItemReady:
                return emplace_<s::order::ItemReady>(root, out, order::parse_item_ready);
            // --- Staff ---
            case MessageType::StaffSync:
                return emplace_<s::staff::Sync>(root, out, staff::parse_sync);
            case MessageType::StaffAdded:
                return emplace_<s::staff::Added>(root, out, staff::parse_added);
            case MessageType::StaffUpdated:
                return emplace_<s::staff::Updated>(root, out, staff::parse_updated);
            case MessageType::StaffRemoved:
                return emplace_<s::staff::Removed>(root, out, staff::parse_removed);
            // --- Floor plan ---
            case MessageType::FloorPlanSync:
                return emplace_<s::floorplan::Sync>(root, out, floorplan::parse_sync);
            case MessageType::SectionAdded:
                return emplace_<s::floorplan::SectionAdded>(root, out, floorplan::parse_section_added);
            case MessageType::SectionRemoved:
                return emplace_<s::floorplan::SectionRemoved>(root, out, floorplan::parse_section_removed);
            case MessageType::TableAdded:
                return emplace_<s::floorplan::TableAdded>(root, out, floorplan::parse_table_added);
            case MessageType::TableRemoved:
                return emplace_<s::floorplan::TableRemoved>(root, out, floorplan::parse_table_removed);
            case MessageType::TableStatusUpdated:
                return emplace_<s::floorplan::TableStatusUpdated>(root, out, floorplan::parse_table_status_updated);
            case MessageType::StaffAssigned:
                return emplace_<s::floorplan::StaffAssigned>(root, out, floorplan::parse_staff_assigned);
            // --- Service requests ---
            case MessageType::ServiceRequest:
                return emplace_<s::service::Created>(root, out, service::parse_created);
            case MessageType::ServiceRequestAcknowledged:
                return emplace_<s::service::Acknowledged>(root, out, service::parse_acknowledged);
            case MessageType::ServiceRequestResolved:
                return emplace_<s::service::Resolved>(root, out, service::parse_resolved);
            // --- Control ---
            case MessageType::SyncRequested:
                return emplace_<s::system::SyncRequested>(root, out, system::parse_sync_requested);
            case MessageType::Pong:
                out = s::system::Pong{};
                return Result::Parsed;
            // --- Outbound only: echoes of our own frames ---
            case MessageType::BroadcastOrder:
            case MessageType::StatusUpdate:
            case MessageType::RequestSync:
            case MessageType::Ping:
                TS_DEBUG("[ROUTER] Outbound message type '" << name << "' received -> ignore message.");
                return Result::Ignored;
            case MessageType::Unknown:
            default:
                TS_WARN("[ROUTER] Unknown message type '" << name << "' -> ignore message.");
                return Result::Ignored;
        }
    }
};

} // namespace tablesync::core::protocol::parser
