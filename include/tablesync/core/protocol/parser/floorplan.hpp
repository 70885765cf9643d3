#pragma once

#include <vector>

#include "tablesync/core/protocol/parser/adapters.hpp"
#include "tablesync/core/protocol/parser/helpers.hpp"
#include "tablesync/core/protocol/schema/floorplan.hpp"
#include "lcr/log/logger.hpp"

#include <simdjson.h>


namespace tablesync::core::protocol::parser::floorplan {

using simdjson::dom::element;

namespace detail {

template <typename T, typename AdapterFn>
[[nodiscard]]
inline Result parse_list_optional(const element& root, const char* key, std::vector<T>& out, AdapterFn adapt) noexcept {
    out.clear();
    simdjson::dom::array arr;
    bool present = false;
    if (helper::parse_array_optional(root, key, arr, present) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (!present) {
        return Result::Parsed;
    }
    for (element el : arr) {
        T item;
        const auto r = adapt(el, item);
        if (r != Result::Parsed) {
            return r;
        }
        out.push_back(std::move(item));
    }
    return Result::Parsed;
}

} // namespace detail

// floorplan_sync: { sections?, tables?, assignments?, timestamp? }
[[nodiscard]]
inline Result parse_sync(const element& root, schema::floorplan::Sync& out) noexcept {
    if (detail::parse_list_optional(root, "sections", out.sections, adapter::parse_section) != Result::Parsed ||
        detail::parse_list_optional(root, "tables", out.tables, adapter::parse_table) != Result::Parsed ||
        detail::parse_list_optional(root, "assignments", out.assignments, adapter::parse_assignment) != Result::Parsed) {
        TS_WARN("[ROUTER] Invalid list in 'floorplan_sync' message -> ignore message.");
        return Result::InvalidSchema;
    }
    if (helper::parse_string_optional(root, "timestamp", out.timestamp) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'timestamp' invalid in 'floorplan_sync' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_section_added(const element& root, schema::floorplan::SectionAdded& out) noexcept {
    element section;
    if (helper::parse_object_required(root, "section", section) != Result::Parsed ||
        adapter::parse_section(section, out.section) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'section' missing or invalid in 'section_added' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_section_removed(const element& root, schema::floorplan::SectionRemoved& out) noexcept {
    if (adapter::parse_id_required(root, "sectionId", out.section_id) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'sectionId' missing or invalid in 'section_removed' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_table_added(const element& root, schema::floorplan::TableAdded& out) noexcept {
    element table;
    if (helper::parse_object_required(root, "table", table) != Result::Parsed ||
        adapter::parse_table(table, out.table) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'table' missing or invalid in 'table_added' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_table_removed(const element& root, schema::floorplan::TableRemoved& out) noexcept {
    if (adapter::parse_id_required(root, "tableId", out.table_id) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'tableId' missing or invalid in 'table_removed' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_table_status_updated(const element& root, schema::floorplan::TableStatusUpdated& out) noexcept {
    if (adapter::parse_id_required(root, "tableId", out.table_id) != Result::Parsed ||
        helper::parse_string_required(root, "status", out.status) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'tableId' or 'status' missing or invalid in 'table_status_updated' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_staff_assigned(const element& root, schema::floorplan::StaffAssigned& out) noexcept {
    element assignment;
    if (helper::parse_object_required(root, "assignment", assignment) != Result::Parsed ||
        adapter::parse_assignment(assignment, out.assignment) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'assignment' missing or invalid in 'staff_assigned' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

} // namespace tablesync::core::protocol::parser::floorplan
