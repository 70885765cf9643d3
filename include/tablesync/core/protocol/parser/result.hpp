#pragma once

#include <cstdint>
#include <string_view>


namespace tablesync::core::protocol::parser {

// Outcome of routing one inbound frame. The first group comes from the
// parsers; Delivered and Duplicate are decided by the sync service once the
// message has gone through the dedup cache.
enum class Result : std::uint8_t {
    Ignored,        // unknown or outbound-only type
    InvalidJson,    // not JSON, or the root is not an object
    InvalidSchema,  // required field missing or of the wrong type
    InvalidValue,   // field present but out of range
    Parsed,

    Delivered,
    Duplicate,
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ignored:       return "Ignored";
        case Result::InvalidJson:   return "InvalidJson";
        case Result::InvalidSchema: return "InvalidSchema";
        case Result::InvalidValue:  return "InvalidValue";
        case Result::Parsed:        return "Parsed";
        case Result::Delivered:     return "Delivered";
        case Result::Duplicate:     return "Duplicate";
    }
    return "Unknown";
}

} // namespace tablesync::core::protocol::parser
