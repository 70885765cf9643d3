/*
===============================================================================
WebSocketConcept
===============================================================================

Minimal transport contract required by CloudChannel.

  • Constructed from a telemetry::WebSocket reference
  • connect() starts an attempt and returns immediately; the outcome arrives
    later as an Open or an Error+Close event
  • A synchronous non-None return from connect() means no attempt was
    started and no Close event will follow
  • close() requests a normal closure (status 1000); a Close event follows
    unless the socket was never connected
  • send() queues one text frame; false if the socket is not open
  • poll_event() drains Open / Message / Error / Close in order

No callbacks. No dynamic dispatch. Single consumer (the poll thread).
===============================================================================
*/
#pragma once

#include <string_view>
#include <concepts>

#include "tablesync/core/transport/error.hpp"
#include "tablesync/core/transport/parse_url.hpp"
#include "tablesync/core/transport/websocket/events.hpp"
#include "tablesync/core/transport/telemetry/websocket.hpp"


namespace tablesync::core::transport {

template<class WS>
concept WebSocketConcept =
    std::constructible_from<WS, telemetry::WebSocket&> &&
    requires(
        WS ws,
        const ParsedUrl& url,
        const std::string_view msg,
        websocket::Event& ev
    )
{
    // Lifecycle
    { ws.connect(url) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // Sending
    { ws.send(msg) } noexcept -> std::same_as<bool>;

    // Event draining
    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
};

} // namespace tablesync::core::transport
