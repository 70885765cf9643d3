#pragma once

#include <string>
#include <string_view>
#include <cstdint>


namespace lcr {
namespace json {

// Escape a string for use inside a JSON string literal (no surrounding quotes).
inline std::string escape(std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
    return out;
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value)
{
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = '0' + (value % 10);
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

// Appends "value" (quoted, escaped)
inline void append_string(std::string& out, std::string_view value) {
    out += '"';
    out += escape(value);
    out += '"';
}

// Appends "key":
inline void append_key(std::string& out, std::string_view key) {
    append_string(out, key);
    out += ':';
}

// Appends "key":"value" with a leading comma unless first.
inline void append_field(std::string& out, std::string_view key, std::string_view value, bool first = false) {
    if (!first) out += ',';
    append_key(out, key);
    append_string(out, value);
}

// Appends "key":<raw> where raw is already valid JSON.
inline void append_raw_field(std::string& out, std::string_view key, std::string_view raw, bool first = false) {
    if (!first) out += ',';
    append_key(out, key);
    out += raw.empty() ? std::string_view{"null"} : raw;
}

} // namespace json
} // namespace lcr
