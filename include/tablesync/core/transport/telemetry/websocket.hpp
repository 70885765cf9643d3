#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"

namespace tablesync::core::transport::telemetry {

// ============================================================================
// WebSocket Telemetry
//
// Mechanical socket facts shared by all WebSocket backends.
// Written from the I/O thread, read from anywhere.
// ============================================================================

struct alignas(64) WebSocket final {
    // Throughput
    lcr::metrics::atomic::counter64 bytes_rx_total;
    lcr::metrics::atomic::counter64 bytes_tx_total;
    lcr::metrics::atomic::counter64 messages_rx_total;
    lcr::metrics::atomic::counter64 messages_tx_total;

    // Errors & lifecycle
    lcr::metrics::atomic::counter32 connect_attempts_total;
    lcr::metrics::atomic::counter32 receive_errors_total;
    lcr::metrics::atomic::counter32 close_events_total;

    // Frames dropped because the event ring was full
    lcr::metrics::atomic::counter32 messages_dropped_total;

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== WebSocket Telemetry ===\n";
        os << "  RX bytes:         " << bytes_rx_total.load() << '\n';
        os << "  TX bytes:         " << bytes_tx_total.load() << '\n';
        os << "  RX messages:      " << messages_rx_total.load() << '\n';
        os << "  TX messages:      " << messages_tx_total.load() << '\n';
        os << "  Connect attempts: " << connect_attempts_total.load() << '\n';
        os << "  Receive errors:   " << receive_errors_total.load() << '\n';
        os << "  Close events:     " << close_events_total.load() << '\n';
        os << "  Dropped messages: " << messages_dropped_total.load() << '\n';
    }
};

static_assert(std::is_standard_layout_v<WebSocket>, "telemetry::WebSocket must be standard layout");
static_assert(!std::is_polymorphic_v<WebSocket>, "telemetry::WebSocket must not be polymorphic");

} // namespace tablesync::core::transport::telemetry
