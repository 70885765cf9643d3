#pragma once

#include "tablesync/core/protocol/parser/adapters.hpp"
#include "tablesync/core/protocol/parser/helpers.hpp"
#include "tablesync/core/protocol/schema/service_request.hpp"
#include "lcr/log/logger.hpp"

#include <simdjson.h>


namespace tablesync::core::protocol::parser::service {

using simdjson::dom::element;

[[nodiscard]]
inline Result parse_created(const element& root, schema::service::Created& out) noexcept {
    element request;
    if (helper::parse_object_required(root, "request", request) != Result::Parsed ||
        adapter::parse_service_request(request, out.request) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'request' missing or invalid in 'service_request' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_acknowledged(const element& root, schema::service::Acknowledged& out) noexcept {
    if (adapter::parse_id_required(root, "requestId", out.request_id) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'requestId' missing or invalid in 'service_request_acknowledged' message -> ignore message.");
        return Result::InvalidSchema;
    }
    if (adapter::parse_id_optional(root, "staffId", out.staff_id) != Result::Parsed ||
        adapter::parse_text_optional(root, "staffName", out.staff_name) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'staffId' or 'staffName' invalid in 'service_request_acknowledged' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_resolved(const element& root, schema::service::Resolved& out) noexcept {
    if (adapter::parse_id_required(root, "requestId", out.request_id) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'requestId' missing or invalid in 'service_request_resolved' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

} // namespace tablesync::core::protocol::parser::service
