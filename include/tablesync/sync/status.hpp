#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include "tablesync/core/transport/state.hpp"


namespace tablesync::sync {

using core::transport::ConnectionState;

// ===============================================
// SYNC PATH (transports currently carrying traffic)
// ===============================================
enum class SyncPath : std::uint8_t {
    None,
    Cloud,
    Lan,
    Both
};

[[nodiscard]]
inline constexpr std::string_view to_string(SyncPath p) noexcept {
    switch (p) {
        case SyncPath::None:  return "none";
        case SyncPath::Cloud: return "cloud";
        case SyncPath::Lan:   return "lan";
        case SyncPath::Both:  return "both";
        default:              return "unknown";
    }
}

// connected if either is connected, else connecting if either is connecting
[[nodiscard]]
inline constexpr ConnectionState aggregate_status(ConnectionState cloud, ConnectionState lan) noexcept {
    if (cloud == ConnectionState::Connected || lan == ConnectionState::Connected) {
        return ConnectionState::Connected;
    }
    if (cloud == ConnectionState::Connecting || lan == ConnectionState::Connecting) {
        return ConnectionState::Connecting;
    }
    return ConnectionState::Disconnected;
}

[[nodiscard]]
inline constexpr SyncPath active_path(ConnectionState cloud, ConnectionState lan) noexcept {
    const bool c = cloud == ConnectionState::Connected;
    const bool l = lan == ConnectionState::Connected;
    if (c && l) return SyncPath::Both;
    if (c)      return SyncPath::Cloud;
    if (l)      return SyncPath::Lan;
    return SyncPath::None;
}

static_assert(aggregate_status(ConnectionState::Connecting, ConnectionState::Connected) == ConnectionState::Connected);
static_assert(active_path(ConnectionState::Connecting, ConnectionState::Connected) == SyncPath::Lan);

// ===============================================
// DETAILED STATUS (diagnostics surface)
// ===============================================
struct CloudStatus {
    ConnectionState status = ConnectionState::Disconnected;
    std::uint32_t reconnect_attempts = 0;
};

struct LanStatus {
    ConnectionState status = ConnectionState::Disconnected;
    bool is_server = false;
    bool server_running = false;
    std::size_t connected_clients = 0;
};

struct DetailedStatus {
    CloudStatus cloud;
    LanStatus lan;
    SyncPath active_path = SyncPath::None;

    // {"cloud":{...},"lan":{...},"activePath":"..."}
    [[nodiscard]] std::string to_json() const;
};

std::ostream& operator<<(std::ostream& os, const DetailedStatus& status);

} // namespace tablesync::sync
