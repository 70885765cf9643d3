/*
===============================================================================
 Cloud Channel Signals
===============================================================================

cloud::Signal values are edge-triggered facts emitted by CloudChannel and
drained through poll_signal(). They are informational: the authoritative
state is always CloudChannel::state().

Connecting
  connect() accepted; state moved Disconnected → Connecting.

Connected
  WebSocket upgrade completed. Attempt counter reset, epoch incremented.

Disconnected
  Transport closed; state moved to Disconnected.

TransportError
  Transport reported an error. State is unchanged; a Disconnected edge
  normally follows. last_error() holds the classification.

RetryScheduled
  A reconnect timer was armed after a close.

RetriesExhausted
  The close happened with the attempt budget used up. No timer armed.
===============================================================================
*/
#pragma once

#include <cstdint>
#include <string_view>


namespace tablesync::core::transport::cloud {

enum class Signal : uint8_t {
    None,
    Connecting,
    Connected,
    Disconnected,
    TransportError,
    RetryScheduled,
    RetriesExhausted,
};

[[nodiscard]]
inline std::string_view to_string(Signal sig) noexcept {
    switch (sig) {
        case Signal::None:             return "None";
        case Signal::Connecting:       return "Connecting";
        case Signal::Connected:        return "Connected";
        case Signal::Disconnected:     return "Disconnected";
        case Signal::TransportError:   return "TransportError";
        case Signal::RetryScheduled:   return "RetryScheduled";
        case Signal::RetriesExhausted: return "RetriesExhausted";
        default:                       return "Unknown";
    }
}

} // namespace tablesync::core::transport::cloud
