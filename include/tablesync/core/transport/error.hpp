#pragma once

#include <cstdint>
#include <string_view>

namespace tablesync::core::transport {

/*
===============================================================================
 transport::Error
===============================================================================

One classification for both sync paths: the cloud WebSocket channel and the
LAN collaborator. Boost.System, OpenSSL and collaborator codes are mapped
onto it at the boundary; nothing above the transport layer sees them.

Callers decide on retry by class:
  - caller mistakes      InvalidUrl, InvalidState
  - peer went away       RemoteClosed
  - worth a retry        Timeout, ConnectionFailed, HandshakeFailed
  - give up on the path  ProtocolError, TransportFailure, Unavailable
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    InvalidUrl,        // scheme, host or port rejected, or empty tenant
    InvalidState,      // operation not allowed in the current state
    Cancelled,         // aborted by a local lifecycle decision

    RemoteClosed,      // CLOSE frame from the relay

    Timeout,
    ConnectionFailed,  // DNS, TCP connect, no LAN host found
    HandshakeFailed,   // TLS or HTTP upgrade

    ProtocolError,     // invalid frame
    TransportFailure,  // anything unclassified
    Unavailable,       // transport not supported on this host
};

inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
        case Error::None:             return "None";
        case Error::InvalidUrl:       return "InvalidUrl";
        case Error::InvalidState:     return "InvalidState";
        case Error::Cancelled:        return "Cancelled";
        case Error::RemoteClosed:     return "RemoteClosed";
        case Error::Timeout:          return "Timeout";
        case Error::ConnectionFailed: return "ConnectionFailed";
        case Error::HandshakeFailed:  return "HandshakeFailed";
        case Error::ProtocolError:    return "ProtocolError";
        case Error::TransportFailure: return "TransportFailure";
        case Error::Unavailable:      return "Unavailable";
    }
    return "Unknown";
}

} // namespace tablesync::core::transport
