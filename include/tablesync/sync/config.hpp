#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "tablesync/core/transport/backoff.hpp"
#include "tablesync/core/transport/cloud_channel.hpp"
#include "tablesync/lan/types.hpp"


namespace tablesync::sync {

// Default relay base; overridden by SyncConfig::cloud_ws_base
inline constexpr std::string_view DEFAULT_CLOUD_WS_BASE = "wss://handsfree-orders.suyesh.workers.dev";

constexpr auto DEDUP_TTL = std::chrono::milliseconds(5 * 60 * 1000);

// ===============================================
// DEVICE MODE (what this terminal is used for)
// ===============================================
enum class DeviceMode : std::uint8_t {
    Pos,
    Manager,
    Kds,
    Bds,
    Service,
    Aggregator
};

[[nodiscard]]
inline constexpr std::string_view to_string(DeviceMode m) noexcept {
    switch (m) {
        case DeviceMode::Pos:        return "pos";
        case DeviceMode::Manager:    return "manager";
        case DeviceMode::Kds:        return "kds";
        case DeviceMode::Bds:        return "bds";
        case DeviceMode::Service:    return "service";
        case DeviceMode::Aggregator: return "aggregator";
        default:                     return "unknown";
    }
}

// Returns false on an unknown name (out untouched)
[[nodiscard]]
inline constexpr bool parse_device_mode(std::string_view name, DeviceMode& out) noexcept {
    constexpr DeviceMode all[] = {
        DeviceMode::Pos, DeviceMode::Manager, DeviceMode::Kds,
        DeviceMode::Bds, DeviceMode::Service, DeviceMode::Aggregator
    };
    for (auto m : all) {
        if (to_string(m) == name) {
            out = m;
            return true;
        }
    }
    return false;
}

// ===============================================
// LAN ROLE
// ===============================================
enum class LanRole : std::uint8_t {
    None,    // LAN not available on this host
    Server,  // Hosts the local server (POS / manager terminals)
    Client   // Joins the local server (displays, service terminals)
};

[[nodiscard]]
inline constexpr std::string_view to_string(LanRole r) noexcept {
    switch (r) {
        case LanRole::None:   return "none";
        case LanRole::Server: return "server";
        case LanRole::Client: return "client";
        default:              return "unknown";
    }
}

// Resolved once per initialize()
struct RoleContext {
    std::string tenant_id;
    bool is_server = false;
    LanRole lan_role = LanRole::None;
};

[[nodiscard]]
inline constexpr bool hosts_lan_server(DeviceMode m) noexcept {
    return m == DeviceMode::Pos || m == DeviceMode::Manager;
}

// Device type announced when joining a LAN host
[[nodiscard]]
inline constexpr lan::DeviceType lan_device_type(DeviceMode m) noexcept {
    switch (m) {
        case DeviceMode::Kds: return lan::DeviceType::Kds;
        case DeviceMode::Bds: return lan::DeviceType::Bds;
        default:              return lan::DeviceType::Manager;
    }
}

[[nodiscard]]
inline RoleContext make_role_context(std::string_view tenant_id, DeviceMode mode, bool lan_available) {
    RoleContext ctx;
    ctx.tenant_id.assign(tenant_id.data(), tenant_id.size());
    ctx.is_server = hosts_lan_server(mode);
    if (lan_available) {
        ctx.lan_role = ctx.is_server ? LanRole::Server : LanRole::Client;
    }
    return ctx;
}

// ===============================================
// SEND RETRY (broadcast while the cloud is down)
// ===============================================
struct SendRetryPolicy {
    std::chrono::milliseconds interval{500};
    std::uint32_t max_polls = 6;
};

// ===============================================
// SYNC SERVICE CONFIGURATION
// ===============================================
struct SyncConfig {
    std::string cloud_ws_base{DEFAULT_CLOUD_WS_BASE};
    DeviceMode device_mode = DeviceMode::Pos;
    core::transport::ReconnectPolicy reconnect{};
    std::chrono::milliseconds dedup_ttl{DEDUP_TTL};
    SendRetryPolicy send_retry{};
    std::chrono::milliseconds heartbeat_interval{core::transport::HEARTBEAT_INTERVAL};
};

} // namespace tablesync::sync
