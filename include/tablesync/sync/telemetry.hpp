#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"


namespace tablesync::sync::telemetry {

// ============================================================================
// Sync Service Telemetry
//
// Inbound classification and outbound fan-out. Transport counters live in
// core::transport::telemetry::Cloud.
// ============================================================================

struct alignas(64) Sync final {
    // Inbound frames (cloud + LAN)
    lcr::metrics::atomic::counter64 frames_received_total;
    lcr::metrics::atomic::counter64 frames_malformed_total;
    lcr::metrics::atomic::counter64 frames_ignored_total;
    lcr::metrics::atomic::counter64 messages_applied_total;
    lcr::metrics::atomic::counter64 duplicates_dropped_total;

    // LAN events drained
    lcr::metrics::atomic::counter64 lan_events_total;

    // Outbound
    lcr::metrics::atomic::counter64 broadcasts_total;
    lcr::metrics::atomic::counter64 cloud_sends_total;
    lcr::metrics::atomic::counter64 cloud_sends_dropped_total;
    lcr::metrics::atomic::counter64 lan_clients_reached_total;

    // Status notifications
    lcr::metrics::atomic::counter32 status_changes_total;

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Sync Telemetry ===\n";
        os << "  Frames received:  " << frames_received_total.load() << '\n';
        os << "  Malformed:        " << frames_malformed_total.load() << '\n';
        os << "  Ignored:          " << frames_ignored_total.load() << '\n';
        os << "  Applied:          " << messages_applied_total.load() << '\n';
        os << "  Duplicates:       " << duplicates_dropped_total.load() << '\n';
        os << "  LAN events:       " << lan_events_total.load() << '\n';
        os << "  Broadcasts:       " << broadcasts_total.load() << '\n';
        os << "  Cloud sends:      " << cloud_sends_total.load() << " (dropped " << cloud_sends_dropped_total.load() << ")\n";
        os << "  LAN clients hit:  " << lan_clients_reached_total.load() << '\n';
        os << "  Status changes:   " << status_changes_total.load() << '\n';
    }
};

static_assert(!std::is_polymorphic_v<Sync>, "telemetry::Sync must not be polymorphic");

} // namespace tablesync::sync::telemetry
