#pragma once

/*
===============================================================================
 tablesync::core::transport::websocket::Event
===============================================================================

Event emitted by a WebSocket transport implementation and drained by the
owning CloudChannel through poll_event().

    • Open     → upgrade completed, socket ready for send()
    • Message  → one complete text frame in `data`
    • Error    → transport-level failure (informational)
    • Close    → transport closed (local or remote), emitted exactly once
                 per transport instance that reached connect()

Transports with an I/O thread hand events over through an SPSC ring;
the poll thread is the single consumer. Open/Error/Close must never be
dropped. Message frames are dropped (and counted) only if the ring is full.
===============================================================================
*/

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "tablesync/core/transport/error.hpp"

namespace tablesync::core::transport::websocket {

enum class EventType : std::uint8_t {
    Open    = 0,
    Message = 1,
    Error   = 2,
    Close   = 3,
};

[[nodiscard]]
inline constexpr std::string_view to_string(EventType t) noexcept {
    switch (t) {
        case EventType::Open:    return "Open";
        case EventType::Message: return "Message";
        case EventType::Error:   return "Error";
        case EventType::Close:   return "Close";
        default:                 return "Unknown";
    }
}

struct Event {
    EventType type = EventType::Close;
    transport::Error error = transport::Error::None; // valid if type == Error
    std::string data;                                // valid if type == Message

    static Event make_open() noexcept {
        Event ev;
        ev.type = EventType::Open;
        return ev;
    }

    static Event make_message(std::string text) noexcept {
        Event ev;
        ev.type = EventType::Message;
        ev.data = std::move(text);
        return ev;
    }

    static Event make_error(transport::Error e) noexcept {
        Event ev;
        ev.type  = EventType::Error;
        ev.error = e;
        return ev;
    }

    static Event make_close() noexcept {
        Event ev;
        ev.type = EventType::Close;
        return ev;
    }
};

} // namespace tablesync::core::transport::websocket
