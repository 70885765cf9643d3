#include "tablesync/core/protocol/redaction.hpp"

#include <string>
#include <string_view>

#include <simdjson.h>

#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"


namespace tablesync::core::protocol::redaction {

namespace {

inline bool is_credential_key_(std::string_view key) noexcept {
    return key == "pin" || key == "pinHash";
}

// Copies every non-credential field of `obj`; appends the PIN mask if asked.
std::string rebuild_without_credentials_(const simdjson::dom::object& obj, bool mask_pin) {
    std::string out{"{"};
    bool first = true;
    for (auto field : obj) {
        if (is_credential_key_(field.key)) {
            continue;
        }
        lcr::json::append_raw_field(out, field.key, simdjson::minify(field.value), first);
        first = false;
    }
    if (mask_pin) {
        lcr::json::append_field(out, "pin", schema::staff::PIN_MASK, first);
    }
    out += '}';
    return out;
}

// Returns false if `raw` is not a JSON object.
bool parse_object_(simdjson::dom::parser& parser, const std::string& raw, simdjson::dom::object& out) {
    simdjson::dom::element root;
    if (parser.parse(raw.data(), raw.size()).get(root)) {
        return false;
    }
    return !root.get(out);
}

} // namespace


schema::staff::Member redact_member(const schema::staff::Member& member) {
    schema::staff::Member safe;
    safe.id = member.id;
    safe.name = member.name;
    safe.role = member.role;

    simdjson::dom::parser parser;
    simdjson::dom::object obj;
    if (!member.raw.empty() && parse_object_(parser, member.raw.text, obj)) {
        safe.raw.text = rebuild_without_credentials_(obj, true);
        return safe;
    }
    if (!member.raw.empty()) {
        TS_WARN("[REDACT] Staff member '" << member.id << "' carries unparseable JSON -> rebuilt from typed fields.");
    }
    std::string out{"{"};
    lcr::json::append_field(out, "id", member.id, true);
    lcr::json::append_field(out, "name", member.name);
    if (!member.role.empty()) {
        lcr::json::append_field(out, "role", member.role);
    }
    lcr::json::append_field(out, "pin", schema::staff::PIN_MASK);
    out += '}';
    safe.raw.text = std::move(out);
    return safe;
}

std::vector<schema::staff::Member> redact_members(const std::vector<schema::staff::Member>& members) {
    std::vector<schema::staff::Member> out;
    out.reserve(members.size());
    for (const auto& m : members) {
        out.push_back(redact_member(m));
    }
    return out;
}

schema::RawJson redact_updates(const schema::RawJson& updates) {
    schema::RawJson safe;
    if (updates.empty()) {
        safe.text = "{}";
        return safe;
    }
    simdjson::dom::parser parser;
    simdjson::dom::object obj;
    if (!parse_object_(parser, updates.text, obj)) {
        TS_WARN("[REDACT] Staff update payload is not a JSON object -> sent as {}.");
        safe.text = "{}";
        return safe;
    }
    safe.text = rebuild_without_credentials_(obj, false);
    return safe;
}

} // namespace tablesync::core::protocol::redaction
