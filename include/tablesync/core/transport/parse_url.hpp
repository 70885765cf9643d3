#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "tablesync/core/transport/error.hpp"


namespace tablesync::core::transport {

inline constexpr std::size_t MAX_URL_LENGTH = 2048;

// Relay endpoint split into the pieces a WebSocket handshake needs.
struct ParsedUrl {
    bool secure = false;   // wss
    std::string host;
    std::string port;      // always set, defaults to 443 / 80
    std::string path;      // always starts with '/', query kept verbatim
};

namespace detail {

[[nodiscard]]
inline bool valid_port(std::string_view port) noexcept {
    if (port.empty() || port.size() > 5) {
        return false;
    }
    unsigned value = 0;
    for (char c : port) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    return value >= 1 && value <= 65535;
}

} // namespace detail

// -----------------------------------------------------------------------------
// ws:// and wss:// only. Userinfo, fragments and bracketed IPv6 hosts are
// rejected rather than half-supported.
//
//   wss://relay.example.com/ws/orders/rest-1  -> secure, 443, /ws/orders/rest-1
//   ws://192.168.1.20:8080                    -> plain, 8080, /
//
// On failure `out` is left empty.
// -----------------------------------------------------------------------------
[[nodiscard]]
inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
    out = ParsedUrl{};
    if (url.size() > MAX_URL_LENGTH) {
        return Error::InvalidUrl;
    }

    bool secure = false;
    if (url.substr(0, 6) == "wss://") {
        secure = true;
        url.remove_prefix(6);
    }
    else if (url.substr(0, 5) == "ws://") {
        url.remove_prefix(5);
    }
    else {
        return Error::InvalidUrl;
    }

    const std::size_t slash = url.find('/');
    const std::string_view authority = url.substr(0, slash);
    const std::string_view path = slash == std::string_view::npos ? std::string_view{"/"} : url.substr(slash);

    if (authority.empty() || authority.front() == '[' ||
        authority.find('@') != std::string_view::npos ||
        path.find('#') != std::string_view::npos) {
        return Error::InvalidUrl;
    }

    std::string_view host = authority;
    std::string_view port = secure ? "443" : "80";
    if (const std::size_t colon = authority.find(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon + 1);
    }
    if (host.empty() || !detail::valid_port(port)) {
        return Error::InvalidUrl;
    }

    out.secure = secure;
    out.host.assign(host);
    out.port.assign(port);
    out.path.assign(path);
    return Error::None;
}

[[nodiscard]]
inline std::string to_string(const ParsedUrl& url) {
    std::string out = url.secure ? "wss://" : "ws://";
    out.append(url.host).append(":").append(url.port).append(url.path);
    return out;
}

} // namespace tablesync::core::transport
