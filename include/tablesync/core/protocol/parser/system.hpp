#pragma once

#include "tablesync/core/protocol/parser/adapters.hpp"
#include "tablesync/core/protocol/schema/system.hpp"
#include "lcr/log/logger.hpp"

#include <simdjson.h>


namespace tablesync::core::protocol::parser::system {

using simdjson::dom::element;

// sync_requested: { requesterId?, deviceType? }
[[nodiscard]]
inline Result parse_sync_requested(const element& root, schema::system::SyncRequested& out) noexcept {
    if (adapter::parse_id_optional(root, "requesterId", out.requester_id) != Result::Parsed ||
        adapter::parse_text_optional(root, "deviceType", out.device_type) != Result::Parsed) {
        TS_WARN("[ROUTER] Field 'requesterId' or 'deviceType' invalid in 'sync_requested' message -> ignore message.");
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

} // namespace tablesync::core::protocol::parser::system
