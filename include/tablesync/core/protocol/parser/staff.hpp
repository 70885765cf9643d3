#pragma once

#include "tablesync/core/protocol/parser/adapters.hpp"
#include "tablesync/core/protocol/parser/helpers.hpp"
#include "tablesync/core/protocol/schema/staff.hpp"
#include "lcr/log/logger.hpp"

#include <simdjson.h>


namespace tablesync::core::protocol::parser::staff {

using simdjson::dom::element;

[[nodiscard]]
inline Result parse_sync(const element& root, schema::staff::Sync& out) noexcept {
    out.staff.clear();
    simdjson::dom::array staff;
    if (helper::parse_array_required(root, "staff", staff) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'staff' missing or invalid in 'staff_sync' message -> ignore message.");
        return Result::InvalidSchema;
    }
    for (element el : staff) {
        schema::staff::Member member;
        if (adapter::parse_staff_member(el, member) != Result::Parsed) {
            TS_WARN("[ROUTER] Invalid member in 'staff_sync' message -> ignore message.");
            return Result::InvalidSchema;
        }
        out.staff.push_back(std::move(member));
    }
    if (helper::parse_string_optional(root, "timestamp", out.timestamp) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'timestamp' invalid in 'staff_sync' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_added(const element& root, schema::staff::Added& out) noexcept {
    element member;
    if (helper::parse_object_required(root, "staff", member) != Result::Parsed ||
        adapter::parse_staff_member(member, out.staff) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'staff' missing or invalid in 'staff_added' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_updated(const element& root, schema::staff::Updated& out) noexcept {
    if (adapter::parse_id_required(root, "staffId", out.staff_id) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'staffId' missing or invalid in 'staff_updated' message -> ignore message.");
        return Result::InvalidSchema;
    }
    element updates;
    bool present = false;
    if (helper::parse_object_optional(root, "updates", updates, present) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'updates' invalid in 'staff_updated' message -> ignore message.");
        return Result::InvalidSchema;
    }
    out.updates = schema::RawJson{};
    if (present) {
        helper::raw_json(updates, out.updates);
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_removed(const element& root, schema::staff::Removed& out) noexcept {
    if (adapter::parse_id_required(root, "staffId", out.staff_id) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'staffId' missing or invalid in 'staff_removed' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

} // namespace tablesync::core::protocol::parser::staff
