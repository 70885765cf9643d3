#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "tablesync/core/protocol/schema/raw_json.hpp"
#include "lcr/json.hpp"
#include "lcr/optional.hpp"


namespace tablesync::core::protocol::schema {
namespace service {

// ===============================================
// SERVICE REQUEST (call waiter, bill, water, ...)
// ===============================================
struct Request {
    std::string id;
    std::string type;
    lcr::optional<std::int64_t> table_number;
    RawJson raw;

    [[nodiscard]]
    inline std::string to_json() const {
        if (!raw.empty()) {
            return raw.text;
        }
        std::string out{"{"};
        lcr::json::append_field(out, "id", id, true);
        lcr::json::append_field(out, "type", type);
        if (table_number.has()) {
            out += ",\"tableNumber\":";
            out += std::to_string(table_number.value());
        }
        out += '}';
        return out;
    }
};

// ===============================================
// service_request
// ===============================================
struct Created {
    Request request;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "service_request", true);
        lcr::json::append_raw_field(out, "request", request.to_json());
        out += '}';
        return out;
    }
};

// ===============================================
// service_request_acknowledged
// ===============================================
struct Acknowledged {
    std::string request_id;
    std::string staff_id;
    std::string staff_name;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "service_request_acknowledged", true);
        lcr::json::append_field(out, "requestId", request_id);
        lcr::json::append_field(out, "staffId", staff_id);
        lcr::json::append_field(out, "staffName", staff_name);
        out += '}';
        return out;
    }
};

// ===============================================
// service_request_resolved
// ===============================================
struct Resolved {
    std::string request_id;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out{"{"};
        lcr::json::append_field(out, "type", "service_request_resolved", true);
        lcr::json::append_field(out, "requestId", request_id);
        out += '}';
        return out;
    }
};

} // namespace service
} // namespace tablesync::core::protocol::schema
