#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>

#include "tablesync/core/protocol/parser/helpers.hpp"
#include "tablesync/core/protocol/schema/order.hpp"
#include "tablesync/core/protocol/schema/staff.hpp"
#include "tablesync/core/protocol/schema/floorplan.hpp"
#include "tablesync/core/protocol/schema/service_request.hpp"

#include <simdjson.h>

/*
================================================================================
Adapters (Domain-Aware Field Parsing)
================================================================================

Sit between message parsers and helpers:

  • Identifiers arrive as strings or integers depending on the producer;
    both normalize to std::string
  • Table numbers arrive as integers or numeric strings
  • Payload objects keep their verbatim JSON in `raw` next to the fields
    the engine interprets

No logging here; parsers decide what to report.
================================================================================
*/


namespace tablesync::core::protocol::parser::adapter {

using simdjson::dom::element;
using simdjson::dom::element_type;

// ------------------------------------------------------------
// IDENTIFIERS
// ------------------------------------------------------------

// Absent/null → empty string
[[nodiscard]]
inline Result parse_id_optional(const element& obj, const char* key, std::string& out) noexcept {
    out.clear();
    if (helper::require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    element field;
    if (obj[key].get(field) || field.is_null()) {
        return Result::Parsed;
    }
    switch (field.type()) {
        case element_type::STRING: {
            std::string_view sv;
            if (field.get(sv)) return Result::InvalidSchema;
            out.assign(sv.data(), sv.size());
            return Result::Parsed;
        }
        case element_type::INT64: {
            std::int64_t v = 0;
            if (field.get(v)) return Result::InvalidSchema;
            out = std::to_string(v);
            return Result::Parsed;
        }
        case element_type::UINT64: {
            std::uint64_t v = 0;
            if (field.get(v)) return Result::InvalidSchema;
            out = std::to_string(v);
            return Result::Parsed;
        }
        default:
            return Result::InvalidSchema;
    }
}

// Required and non-empty
[[nodiscard]]
inline Result parse_id_required(const element& obj, const char* key, std::string& out) noexcept {
    if (helper::require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    element field;
    if (obj[key].get(field) || field.is_null()) {
        return Result::InvalidSchema;
    }
    auto r = parse_id_optional(obj, key, out);
    if (r != Result::Parsed) {
        return r;
    }
    return out.empty() ? Result::InvalidValue : Result::Parsed;
}

// Absent/null → empty string
[[nodiscard]]
inline Result parse_text_optional(const element& obj, const char* key, std::string& out) noexcept {
    lcr::optional<std::string> tmp;
    auto r = helper::parse_string_optional(obj, key, tmp);
    if (r != Result::Parsed) {
        return r;
    }
    out = tmp.has() ? std::move(tmp.value()) : std::string{};
    return Result::Parsed;
}

// Identifier-like optional text (string or integer)
[[nodiscard]]
inline Result parse_id_text_optional(const element& obj, const char* key, lcr::optional<std::string>& out) noexcept {
    out.reset();
    std::string tmp;
    element field;
    if (helper::require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (obj[key].get(field) || field.is_null()) {
        return Result::Parsed;
    }
    auto r = parse_id_optional(obj, key, tmp);
    if (r != Result::Parsed) {
        return r;
    }
    out = std::move(tmp);
    return Result::Parsed;
}

// ------------------------------------------------------------
// TABLE NUMBER (integer or numeric string)
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_table_number_optional(const element& obj, const char* key, lcr::optional<std::int64_t>& out) noexcept {
    out.reset();
    if (helper::require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    element field;
    if (obj[key].get(field) || field.is_null()) {
        return Result::Parsed;
    }
    if (field.type() == element_type::STRING) {
        std::string_view sv;
        if (field.get(sv)) return Result::InvalidSchema;
        if (sv.empty()) return Result::Parsed;
        std::int64_t v = 0;
        const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
        if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
            return Result::InvalidValue;
        }
        out = v;
        return Result::Parsed;
    }
    return helper::parse_int64_optional(obj, key, out);
}

// ------------------------------------------------------------
// ORDERS
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_kitchen_item(const element& el, schema::order::KitchenItem& out) noexcept {
    if (helper::require_object(el) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    Result r;
    if ((r = parse_id_optional(el, "id", out.id)) != Result::Parsed) return r;
    if ((r = parse_text_optional(el, "name", out.name)) != Result::Parsed) return r;
    if ((r = parse_text_optional(el, "status", out.status)) != Result::Parsed) return r;
    lcr::optional<std::uint64_t> qty;
    if ((r = helper::parse_uint64_optional(el, "quantity", qty)) != Result::Parsed) return r;
    out.quantity = static_cast<std::uint32_t>(qty.value_or(0));
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_kitchen_order(const element& el, schema::order::KitchenOrder& out) noexcept {
    out = schema::order::KitchenOrder{};
    if (helper::require_object(el) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    Result r;
    if ((r = parse_id_optional(el, "id", out.id)) != Result::Parsed) return r;
    if ((r = parse_id_optional(el, "orderNumber", out.order_number)) != Result::Parsed) return r;
    if ((r = parse_text_optional(el, "orderType", out.order_type)) != Result::Parsed) return r;
    if ((r = parse_text_optional(el, "status", out.status)) != Result::Parsed) return r;
    if ((r = parse_table_number_optional(el, "tableNumber", out.table_number)) != Result::Parsed) return r;

    simdjson::dom::array items;
    bool has_items = false;
    if ((r = helper::parse_array_optional(el, "items", items, has_items)) != Result::Parsed) return r;
    if (has_items) {
        for (element item_el : items) {
            schema::order::KitchenItem item;
            if ((r = parse_kitchen_item(item_el, item)) != Result::Parsed) return r;
            out.items.push_back(std::move(item));
        }
    }
    helper::raw_json(el, out.raw);
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_order(const element& el, schema::order::Order& out) noexcept {
    out = schema::order::Order{};
    if (helper::require_object(el) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto r = parse_id_optional(el, "orderId", out.order_id);
    if (r != Result::Parsed) {
        return r;
    }
    helper::raw_json(el, out.raw);
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_table_info(const element& el, schema::order::TableInfo& out) noexcept {
    out = schema::order::TableInfo{};
    Result r;
    if ((r = parse_id_optional(el, "tableId", out.table_id)) != Result::Parsed) return r;
    if ((r = parse_table_number_optional(el, "tableNumber", out.table_number)) != Result::Parsed) return r;
    return parse_text_optional(el, "sectionName", out.section_name);
}

// ------------------------------------------------------------
// STAFF
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_staff_member(const element& el, schema::staff::Member& out) noexcept {
    out = schema::staff::Member{};
    if (helper::require_object(el) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    Result r;
    if ((r = parse_id_optional(el, "id", out.id)) != Result::Parsed) return r;
    if ((r = parse_text_optional(el, "name", out.name)) != Result::Parsed) return r;
    if ((r = parse_text_optional(el, "role", out.role)) != Result::Parsed) return r;
    helper::raw_json(el, out.raw);
    return Result::Parsed;
}

// ------------------------------------------------------------
// FLOOR PLAN
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_section(const element& el, schema::floorplan::Section& out) noexcept {
    out = schema::floorplan::Section{};
    if (helper::require_object(el) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    Result r;
    if ((r = parse_id_optional(el, "id", out.id)) != Result::Parsed) return r;
    if ((r = parse_text_optional(el, "name", out.name)) != Result::Parsed) return r;
    helper::raw_json(el, out.raw);
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_table(const element& el, schema::floorplan::Table& out) noexcept {
    out = schema::floorplan::Table{};
    if (helper::require_object(el) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    Result r;
    if ((r = parse_id_optional(el, "id", out.id)) != Result::Parsed) return r;
    if ((r = parse_table_number_optional(el, "tableNumber", out.table_number)) != Result::Parsed) return r;
    if ((r = parse_id_optional(el, "sectionId", out.section_id)) != Result::Parsed) return r;
    if ((r = parse_text_optional(el, "status", out.status)) != Result::Parsed) return r;
    helper::raw_json(el, out.raw);
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_assignment(const element& el, schema::floorplan::Assignment& out) noexcept {
    out = schema::floorplan::Assignment{};
    if (helper::require_object(el) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    Result r;
    if ((r = parse_id_optional(el, "userId", out.user_id)) != Result::Parsed) return r;
    if ((r = parse_id_optional(el, "tableId", out.table_id)) != Result::Parsed) return r;
    if ((r = parse_id_optional(el, "sectionId", out.section_id)) != Result::Parsed) return r;
    helper::raw_json(el, out.raw);
    return Result::Parsed;
}

// ------------------------------------------------------------
// SERVICE REQUESTS
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_service_request(const element& el, schema::service::Request& out) noexcept {
    out = schema::service::Request{};
    if (helper::require_object(el) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    Result r;
    if ((r = parse_id_optional(el, "id", out.id)) != Result::Parsed) return r;
    if ((r = parse_text_optional(el, "type", out.type)) != Result::Parsed) return r;
    if ((r = parse_table_number_optional(el, "tableNumber", out.table_number)) != Result::Parsed) return r;
    helper::raw_json(el, out.raw);
    return Result::Parsed;
}

} // namespace tablesync::core::protocol::parser::adapter
