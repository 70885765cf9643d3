#pragma once

#include <ostream>
#include <type_traits>

#include "tablesync/core/transport/telemetry/websocket.hpp"

#include "lcr/metrics/atomic/counter.hpp"

namespace tablesync::core::transport::telemetry {

// ============================================================================
// Cloud Channel Telemetry
//
// Channel-level state transitions and decisions.
// Does NOT duplicate WebSocket telemetry (embedded below).
// ============================================================================

struct alignas(64) Cloud final {
    // connect() accepted (state was Disconnected and an endpoint was set)
    lcr::metrics::atomic::counter32 connect_calls_total;

    // Transport reached Open
    lcr::metrics::atomic::counter32 connect_success_total;

    // Transport closed (any cause)
    lcr::metrics::atomic::counter32 disconnect_events_total;

    // Reconnect timers armed / retries exhausted
    lcr::metrics::atomic::counter32 retry_scheduled_total;
    lcr::metrics::atomic::counter32 retry_exhausted_total;

    // Heartbeat
    lcr::metrics::atomic::counter32 pings_sent_total;
    lcr::metrics::atomic::counter32 pongs_received_total;

    // send() outcomes
    lcr::metrics::atomic::counter64 send_calls_total;
    lcr::metrics::atomic::counter64 send_rejected_total;

    // Signals lost because the signal ring was full
    lcr::metrics::atomic::counter32 signals_dropped_total;

    WebSocket websocket;

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Cloud Channel Telemetry ===\n";
        os << "  Connect calls:    " << connect_calls_total.load() << '\n';
        os << "  Connected:        " << connect_success_total.load() << '\n';
        os << "  Disconnects:      " << disconnect_events_total.load() << '\n';
        os << "  Retries armed:    " << retry_scheduled_total.load() << '\n';
        os << "  Retries exhausted:" << retry_exhausted_total.load() << '\n';
        os << "  Pings / pongs:    " << pings_sent_total.load() << " / " << pongs_received_total.load() << '\n';
        os << "  Sends (rejected): " << send_calls_total.load() << " (" << send_rejected_total.load() << ")\n";
        websocket.debug_dump(os);
    }
};

static_assert(!std::is_polymorphic_v<Cloud>, "telemetry::Cloud must not be polymorphic");

} // namespace tablesync::core::transport::telemetry
