#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "tablesync/core/protocol/parser/result.hpp"
#include "tablesync/core/protocol/schema/raw_json.hpp"
#include "lcr/optional.hpp"

#include <simdjson.h>

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Safe extraction of primitive JSON values from simdjson DOM elements.

  • Enforce structural rules (object presence, type correctness)
  • Strict optional-field semantics: missing or null → absent,
    wrong type → InvalidSchema
  • Return Result::Parsed on success
  • Never log, never throw, never interpret values semantically

================================================================================
*/


namespace tablesync::core::protocol::parser::helper {

using simdjson::dom::element;
using simdjson::dom::element_type;

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const element& root) noexcept {
    return (root.type() == element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// Looks up `key`; false when missing or null.
[[nodiscard]]
inline bool lookup_(const element& obj, const char* key, element& out) noexcept {
    if (obj[key].get(out)) {
        return false;
    }
    return !out.is_null();
}

// ------------------------------------------------------------
// OBJECT FIELDS
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_object_required(const element& parent, const char* key, element& out) noexcept {
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (!lookup_(parent, key, out)) {
        return Result::InvalidSchema;
    }
    return require_object(out);
}

[[nodiscard]]
inline Result parse_object_optional(const element& parent, const char* key, element& out, bool& present) noexcept {
    present = false;
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    if (!lookup_(parent, key, out)) {
        return Result::Parsed;
    }
    if (require_object(out) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

// ------------------------------------------------------------
// ARRAY FIELDS
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_array_required(const element& parent, const char* key, simdjson::dom::array& out) noexcept {
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    element field;
    if (!lookup_(parent, key, field)) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_array_optional(const element& parent, const char* key, simdjson::dom::array& out, bool& present) noexcept {
    present = false;
    if (require_object(parent) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    element field;
    if (!lookup_(parent, key, field)) {
        return Result::Parsed;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

// ------------------------------------------------------------
// STRING FIELDS
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_string_required(const element& obj, const char* key, std::string& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    element field;
    std::string_view sv;
    if (!lookup_(obj, key, field) || field.get(sv)) {
        return Result::InvalidSchema;
    }
    out.assign(sv.data(), sv.size());
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_string_optional(const element& obj, const char* key, lcr::optional<std::string>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    element field;
    if (!lookup_(obj, key, field)) {
        return Result::Parsed;
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Result::InvalidSchema;
    }
    out = std::string(sv);
    return Result::Parsed;
}

// ------------------------------------------------------------
// INTEGER FIELDS
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_int64_optional(const element& obj, const char* key, lcr::optional<std::int64_t>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    element field;
    if (!lookup_(obj, key, field)) {
        return Result::Parsed;
    }
    std::int64_t v = 0;
    if (field.get(v)) {
        return Result::InvalidSchema;
    }
    out = v;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_uint64_optional(const element& obj, const char* key, lcr::optional<std::uint64_t>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    element field;
    if (!lookup_(obj, key, field)) {
        return Result::Parsed;
    }
    std::uint64_t v = 0;
    if (field.get(v)) {
        return Result::InvalidSchema;
    }
    out = v;
    return Result::Parsed;
}

// ------------------------------------------------------------
// RAW (verbatim, minified)
// ------------------------------------------------------------
inline void raw_json(const element& value, schema::RawJson& out) noexcept {
    out.text = simdjson::minify(value);
}

} // namespace tablesync::core::protocol::parser::helper
