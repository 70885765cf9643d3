#pragma once

#include "tablesync/core/protocol/parser/adapters.hpp"
#include "tablesync/core/protocol/parser/helpers.hpp"
#include "tablesync/core/protocol/schema/order.hpp"
#include "lcr/log/logger.hpp"

#include <simdjson.h>

#include <cstddef>


namespace tablesync::core::protocol::parser::order {

using simdjson::dom::element;

// ------------------------------------------------------------
// order_created: { order?, kitchenOrder? }
// The dedup id is kitchenOrder.id, falling back to order.orderId;
// a frame must carry at least one of them.
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_created(const element& root, schema::order::Created& out) noexcept {
    out.kitchen_order = schema::order::KitchenOrder{};
    out.order = schema::order::Order{};

    element ko;
    bool has_kitchen_order = false;
    if (helper::parse_object_optional(root, "kitchenOrder", ko, has_kitchen_order) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'kitchenOrder' invalid in 'order_created' message -> ignore message.");
        return Result::InvalidSchema;
    }
    Result r;
    if (has_kitchen_order && (r = adapter::parse_kitchen_order(ko, out.kitchen_order)) != Result::Parsed) {
        TS_WARN("[ROUTER] Invalid 'kitchenOrder' in 'order_created' message (" << to_string(r) << ")");
        return r;
    }

    element o;
    bool has_order = false;
    if (helper::parse_object_optional(root, "order", o, has_order) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'order' invalid in 'order_created' message -> ignore message.");
        return Result::InvalidSchema;
    }
    if (has_order && (r = adapter::parse_order(o, out.order)) != Result::Parsed) {
        TS_WARN("[ROUTER] Invalid 'order' in 'order_created' message (" << to_string(r) << ")");
        return r;
    }

    if (!has_order && !has_kitchen_order) {
        TS_WARN("[ROUTER] 'order_created' message carries neither 'order' nor 'kitchenOrder' -> ignore message.");
        return Result::InvalidSchema;
    }
    if (out.id().empty()) {
        TS_WARN("[ROUTER] 'order_created' message carries no order id -> ignore message.");
        return Result::InvalidValue;
    }
    return Result::Parsed;
}

// ------------------------------------------------------------
// order_status_update: { orderId, status, orderNumber?, tableNumber?, orderType? }
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_status_update(const element& root, schema::order::StatusUpdate& out) noexcept {
    if (adapter::parse_id_required(root, "orderId", out.order_id) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'orderId' missing or invalid in 'order_status_update' message -> ignore message.");
        return Result::InvalidSchema;
    }
    if (helper::parse_string_required(root, "status", out.status) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'status' missing or invalid in 'order_status_update' message -> ignore message.");
        return Result::InvalidSchema;
    }
    if (adapter::parse_id_text_optional(root, "orderNumber", out.order_number) != Result::Parsed ||
        adapter::parse_table_number_optional(root, "tableNumber", out.table_number) != Result::Parsed ||
        helper::parse_string_optional(root, "orderType", out.order_type) != Result::Parsed) {
        TS_WARN("[ROUTER] Optional field invalid in 'order_status_update' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ------------------------------------------------------------
// item_status_update: { orderId, itemId, status, itemName?, orderNumber?, tableNumber? }
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_item_status_update(const element& root, schema::order::ItemStatusUpdate& out) noexcept {
    if (adapter::parse_id_required(root, "orderId", out.order_id) != Result::Parsed ||
        adapter::parse_id_required(root, "itemId", out.item_id) != Result::Parsed ||
        helper::parse_string_required(root, "status", out.status) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'orderId', 'itemId' or 'status' missing or invalid in 'item_status_update' message -> ignore message.");
        return Result::InvalidSchema;
    }
    if (helper::parse_string_optional(root, "itemName", out.item_name) != Result::Parsed ||
        adapter::parse_id_text_optional(root, "orderNumber", out.order_number) != Result::Parsed ||
        adapter::parse_table_number_optional(root, "tableNumber", out.table_number) != Result::Parsed) {
        TS_WARN("[ROUTER] Optional field invalid in 'item_status_update' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ------------------------------------------------------------
// sync_state: { activeOrders: [...] }
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_sync_state(const element& root, schema::order::SyncState& out) noexcept {
    out.active_orders.clear();
    simdjson::dom::array orders;
    if (helper::parse_array_required(root, "activeOrders", orders) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'activeOrders' missing or invalid in 'sync_state' message -> ignore message.");
        return Result::InvalidSchema;
    }
    // One bad entry does not cost the rest of the snapshot
    std::size_t index = 0;
    for (element el : orders) {
        schema::order::KitchenOrder ko;
        const auto r = adapter::parse_kitchen_order(el, ko);
        if (r != Result::Parsed) {
            TS_WARN("[ROUTER] Skipping invalid order #" << index << " in 'sync_state' snapshot (" << to_string(r) << ")");
        } else {
            out.active_orders.push_back(std::move(ko));
        }
        ++index;
    }
    return Result::Parsed;
}

// ------------------------------------------------------------
// qr_order_created: { order?, tableInfo?, kitchenOrder? }
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_qr_created(const element& root, schema::order::QrCreated& out) noexcept {
    schema::order::Created base;
    auto r = parse_created(root, base);
    if (r != Result::Parsed) {
        return r;
    }
    out.order = std::move(base.order);
    out.kitchen_order = std::move(base.kitchen_order);
    element info;
    bool has_info = false;
    out.table_info = schema::order::TableInfo{};
    if (helper::parse_object_optional(root, "tableInfo", info, has_info) != Result::Parsed ||
        (has_info && adapter::parse_table_info(info, out.table_info) != Result::Parsed)) {
        TS_WARN("[ROUTER] Field 'tableInfo' invalid in 'qr_order_created' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ------------------------------------------------------------
// item_ready: { orderId, itemId, itemName?, orderNumber?, tableNumber?, assignedStaffId? }
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_item_ready(const element& root, schema::order::ItemReady& out) noexcept {
    if (adapter::parse_id_required(root, "orderId", out.order_id) != Result::Parsed ||
        adapter::parse_id_required(root, "itemId", out.item_id) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'orderId' or 'itemId' missing or invalid in 'item_ready' message -> ignore message.");
        return Result::InvalidSchema;
    }
    if (adapter::parse_text_optional(root, "itemName", out.item_name) != Result::Parsed ||
        adapter::parse_id_optional(root, "orderNumber", out.order_number) != Result::Parsed ||
        adapter::parse_table_number_optional(root, "tableNumber", out.table_number) != Result::Parsed ||
        adapter::parse_id_text_optional(root, "assignedStaffId", out.assigned_staff_id) != Result::Parsed) {
        TS_WARN("[ROUTER] Optional field invalid in 'item_ready' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

} // namespace tablesync::core::protocol::parser::order
