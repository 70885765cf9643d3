#pragma once

#include <string>


namespace tablesync::core::protocol::schema {

// A JSON value kept verbatim (minified). Payload fields the engine does not
// interpret travel through unchanged.
struct RawJson {
    std::string text;

    [[nodiscard]] inline bool empty() const noexcept { return text.empty(); }
};

} // namespace tablesync::core::protocol::schema
