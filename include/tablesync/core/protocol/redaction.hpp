#pragma once

#include <vector>

#include "tablesync/core/protocol/schema/raw_json.hpp"
#include "tablesync/core/protocol/schema/staff.hpp"


namespace tablesync::core::protocol::redaction {

/*
===============================================================================
 Staff credential redaction
===============================================================================

Staff frames leave this process only through the functions below.

  • redact_member()   : "pin" replaced by "****", "pinHash" removed
  • redact_updates()  : "pin" and "pinHash" removed from a partial update
  • redact_members()  : redact_member() over a list

Every other field of the raw object is forwarded verbatim. A member whose raw
JSON cannot be parsed is rebuilt from {id, name, role} plus the mask; an
unparseable update object becomes {}.
===============================================================================
*/

[[nodiscard]]
schema::staff::Member redact_member(const schema::staff::Member& member);

[[nodiscard]]
std::vector<schema::staff::Member> redact_members(const std::vector<schema::staff::Member>& members);

[[nodiscard]]
schema::RawJson redact_updates(const schema::RawJson& updates);

} // namespace tablesync::core::protocol::redaction
