#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "tablesync/core/protocol/schema/raw_json.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace tablesync::core::protocol::schema {
namespace floorplan {

namespace detail {

template <typename T>
inline void append_array(std::string& out, std::string_view key, const std::vector<T>& items) {
    out += ',';
    lcr::json::append_key(out, key);
    out += '[';
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) out += ',';
        out += items[i].to_json();
    }
    out += ']';
}

} // namespace detail

// ===============================================
// SECTION
// ===============================================
struct Section {
    std::string id;
    std::string name;
    RawJson raw;

    [[nodiscard]]
    inline std::string to_json() const {
        if (!raw.empty()) {
            return raw.text;
        }
        std::string out{"{"};
        lcr::json::append_field(out, "id", id, true);
        lcr::json::append_field(out, "name", name);
        out += '}';
        return out;
    }
};

// ===============================================
// TABLE
// ===============================================
struct Table {
    std::string id;
    lcr::optional<std::int64_t> table_number;
    std::string section_id;
    std::string status;
    RawJson raw;

    [[nodiscard]]
    inline std::string to_json() const {
        if (!raw.empty()) {
            return raw.text;
        }
        std::string out{"{"};
        lcr::json::append_field(out, "id", id, true);
        if (table_number.has()) {
            out += ",\"tableNumber\":";
            out += std::to_string(table_number.value());
        }
        if (!section_id.empty()) {
            lcr::json::append_field(out, "sectionId", section_id);
        }
        if (!status.empty()) {
            lcr::json::append_field(out, "status", status);
        }
        out += '}';
        return out;
    }
};

// ===============================================
// STAFF ASSIGNMENT (staff member → table/section)
// ===============================================
struct Assignment {
    std::string user_id;
    std::string table_id;
    std::string section_id;
    RawJson raw;

    [[nodiscard]]
    inline std::string to_json() const {
        if (!raw.empty()) {
            return raw.text;
        }
        std::string out{"{"};
        lcr::json::append_field(out, "userId", user_id, true);
        if (!table_id.empty()) {
            lcr::json::append_field(out, "tableId", table_id);
        }
        if (!section_id.empty()) {
            lcr::json::append_field(out, "sectionId", section_id);
        }
        out += '}';
        return out;
    }
};

// ===============================================
// floorplan_sync
// ===============================================
struct Sync {
    std::vector<Section> sections;
    std::vector<Table> tables;
    std::vector<Assignment> assignments;
    lcr::optional<std::string> timestamp;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "floorplan_sync", true);
        detail::append_array(out, "sections", sections);
        detail::append_array(out, "tables", tables);
        detail::append_array(out, "assignments", assignments);
        if (timestamp.has()) {
            lcr::json::append_field(out, "timestamp", timestamp.value());
        }
        out += '}';
        return out;
    }
};

// ===============================================
// section_added / section_removed
// ===============================================
struct SectionAdded {
    Section section;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "section_added", true);
        lcr::json::append_raw_field(out, "section", section.to_json());
        out += '}';
        return out;
    }
};

struct SectionRemoved {
    std::string section_id;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "section_removed", true);
        lcr::json::append_field(out, "sectionId", section_id);
        out += '}';
        return out;
    }
};

// ===============================================
// table_added / table_removed / table_status_updated
// ===============================================
struct TableAdded {
    Table table;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "table_added", true);
        lcr::json::append_raw_field(out, "table", table.to_json());
        out += '}';
        return out;
    }
};

struct TableRemoved {
    std::string table_id;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "table_removed", true);
        lcr::json::append_field(out, "tableId", table_id);
        out += '}';
        return out;
    }
};

struct TableStatusUpdated {
    std::string table_id;
    std::string status;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "table_status_updated", true);
        lcr::json::append_field(out, "tableId", table_id);
        lcr::json::append_field(out, "status", status);
        out += '}';
        return out;
    }
};

// ===============================================
// staff_assigned
// ===============================================
struct StaffAssigned {
    Assignment assignment;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "staff_assigned", true);
        lcr::json::append_raw_field(out, "assignment", assignment.to_json());
        out += '}';
        return out;
    }
};

} // namespace floorplan
} // namespace tablesync::core::protocol::schema
