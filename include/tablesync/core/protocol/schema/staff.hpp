#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "tablesync/core/protocol/schema/raw_json.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace tablesync::core::protocol::schema {
namespace staff {

// Placeholder transmitted instead of a PIN
inline constexpr const char* PIN_MASK = "****";

// ===============================================
// STAFF MEMBER
// ===============================================
// No PIN field on purpose: a PIN can only ever travel inside `raw`, and
// outbound staff frames are built from redacted raw objects
// (see protocol/redaction.hpp).
struct Member {
    std::string id;
    std::string name;
    std::string role;
    RawJson raw;

    [[nodiscard]]
    inline std::string to_json() const {
        if (!raw.empty()) {
            return raw.text;
        }
        std::string out{"{"};
        lcr::json::append_field(out, "id", id, true);
        lcr::json::append_field(out, "name", name);
        if (!role.empty()) {
            lcr::json::append_field(out, "role", role);
        }
        out += '}';
        return out;
    }
};

// ===============================================
// staff_sync
// ===============================================
struct Sync {
    std::vector<Member> staff;
    lcr::optional<std::string> timestamp;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "staff_sync", true);
        out += ",\"staff\":[";
        for (std::size_t i = 0; i < staff.size(); ++i) {
            if (i) out += ',';
            out += staff[i].to_json();
        }
        out += ']';
        if (timestamp.has()) {
            lcr::json::append_field(out, "timestamp", timestamp.value());
        }
        out += '}';
        return out;
    }
};

// ===============================================
// staff_added
// ===============================================
struct Added {
    Member staff;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "staff_added", true);
        lcr::json::append_raw_field(out, "staff", staff.to_json());
        out += '}';
        return out;
    }
};

// ===============================================
// staff_updated (partial object)
// ===============================================
struct Updated {
    std::string staff_id;
    RawJson updates;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "staff_updated", true);
        lcr::json::append_field(out, "staffId", staff_id);
        lcr::json::append_raw_field(out, "updates", updates.empty() ? std::string_view{"{}"} : std::string_view{updates.text});
        out += '}';
        return out;
    }
};

// ===============================================
// staff_removed
// ===============================================
struct Removed {
    std::string staff_id;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "staff_removed", true);
        lcr::json::append_field(out, "staffId", staff_id);
        out += '}';
        return out;
    }
};

} // namespace staff
} // namespace tablesync::core::protocol::schema
