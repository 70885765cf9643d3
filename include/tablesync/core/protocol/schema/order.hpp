#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "tablesync/core/protocol/schema/raw_json.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace tablesync::core::protocol::schema {
namespace order {

namespace detail {

inline void append_table_number(std::string& out, const lcr::optional<std::int64_t>& table_number) {
    out += ",\"tableNumber\":";
    if (table_number.has()) {
        out += std::to_string(table_number.value());
    } else {
        out += "null";
    }
}

inline void append_optional_string(std::string& out, std::string_view key, const lcr::optional<std::string>& value) {
    if (value.has()) {
        lcr::json::append_field(out, key, value.value());
    }
}

} // namespace detail

// ===============================================
// KITCHEN ORDER ITEM
// ===============================================
struct KitchenItem {
    std::string id;
    std::string name;
    std::uint32_t quantity = 0;
    std::string status;
};

// ===============================================
// KITCHEN ORDER (KOT as consumed by kitchen displays)
// ===============================================
struct KitchenOrder {
    std::string id;
    std::string order_number;
    std::string order_type;
    std::string status;
    lcr::optional<std::int64_t> table_number;
    std::vector<KitchenItem> items;

    // Full object as received, if any. Preferred when forwarding.
    RawJson raw;

    [[nodiscard]]
    inline std::string to_json() const {
        if (!raw.empty()) {
            return raw.text;
        }
        std::string out;
        out.reserve(128 + items.size() * 64);
        out += '{';
        lcr::json::append_field(out, "id", id, true);
        lcr::json::append_field(out, "orderNumber", order_number);
        lcr::json::append_field(out, "orderType", order_type);
        lcr::json::append_field(out, "status", status);
        detail::append_table_number(out, table_number);
        out += ",\"items\":[";
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i) out += ',';
            out += '{';
            lcr::json::append_field(out, "id", items[i].id, true);
            lcr::json::append_field(out, "name", items[i].name);
            out += ",\"quantity\":";
            lcr::json::append(out, items[i].quantity);
            lcr::json::append_field(out, "status", items[i].status);
            out += '}';
        }
        out += "]}";
        return out;
    }
};

// ===============================================
// POS ORDER (opaque apart from its id)
// ===============================================
struct Order {
    std::string order_id;
    RawJson raw;

    [[nodiscard]]
    inline std::string to_json() const {
        if (!raw.empty()) {
            return raw.text;
        }
        std::string out{"{"};
        lcr::json::append_field(out, "orderId", order_id, true);
        out += '}';
        return out;
    }
};

// Identity used for de-duplication: kitchen order id, else POS order id.
[[nodiscard]]
inline const std::string& dedup_id(const Order& order, const KitchenOrder& kitchen_order) noexcept {
    return kitchen_order.id.empty() ? order.order_id : kitchen_order.id;
}

// ===============================================
// TABLE INFO (attached to QR orders)
// ===============================================
struct TableInfo {
    std::string table_id;
    lcr::optional<std::int64_t> table_number;
    std::string section_name;
};

// ===============================================
// INBOUND: order_created
// ===============================================
struct Created {
    Order order;
    KitchenOrder kitchen_order;

    [[nodiscard]] inline const std::string& id() const noexcept { return dedup_id(order, kitchen_order); }
};

// ===============================================
// INBOUND: order_status_update / OUTBOUND: status_update
// ===============================================
struct StatusUpdate {
    std::string order_id;
    std::string status;
    lcr::optional<std::string> order_number;
    lcr::optional<std::int64_t> table_number;
    lcr::optional<std::string> order_type;

    // Outbound frame
    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "status_update", true);
        lcr::json::append_field(out, "orderId", order_id);
        lcr::json::append_field(out, "status", status);
        detail::append_optional_string(out, "orderNumber", order_number);
        detail::append_table_number(out, table_number);
        detail::append_optional_string(out, "orderType", order_type);
        out += '}';
        return out;
    }
};

// ===============================================
// item_status_update (both directions)
// ===============================================
struct ItemStatusUpdate {
    std::string order_id;
    std::string item_id;
    std::string status;
    lcr::optional<std::string> order_number;
    lcr::optional<std::int64_t> table_number;
    lcr::optional<std::string> item_name;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "item_status_update", true);
        lcr::json::append_field(out, "orderId", order_id);
        lcr::json::append_field(out, "itemId", item_id);
        lcr::json::append_field(out, "status", status);
        detail::append_optional_string(out, "orderNumber", order_number);
        detail::append_table_number(out, table_number);
        detail::append_optional_string(out, "itemName", item_name);
        out += '}';
        return out;
    }
};

// ===============================================
// INBOUND: sync_state (active order snapshot)
// ===============================================
struct SyncState {
    std::vector<KitchenOrder> active_orders;
};

// ===============================================
// INBOUND: qr_order_created
// ===============================================
struct QrCreated {
    Order order;
    TableInfo table_info;
    KitchenOrder kitchen_order;

    [[nodiscard]] inline const std::string& id() const noexcept { return dedup_id(order, kitchen_order); }
};

// ===============================================
// item_ready (both directions)
// ===============================================
struct ItemReady {
    std::string order_id;
    std::string item_id;
    std::string item_name;
    std::string order_number;
    lcr::optional<std::int64_t> table_number;
    lcr::optional<std::string> assigned_staff_id;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "item_ready", true);
        lcr::json::append_field(out, "orderId", order_id);
        lcr::json::append_field(out, "itemId", item_id);
        lcr::json::append_field(out, "itemName", item_name);
        lcr::json::append_field(out, "orderNumber", order_number);
        detail::append_table_number(out, table_number);
        detail::append_optional_string(out, "assignedStaffId", assigned_staff_id);
        out += '}';
        return out;
    }
};

// ===============================================
// OUTBOUND: broadcast_order
// ===============================================
struct Broadcast {
    const Order& order;
    const KitchenOrder& kitchen_order;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "broadcast_order", true);
        lcr::json::append_raw_field(out, "order", order.to_json());
        lcr::json::append_raw_field(out, "kitchenOrder", kitchen_order.to_json());
        out += '}';
        return out;
    }
};

} // namespace order
} // namespace tablesync::core::protocol::schema
