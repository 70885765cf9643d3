#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "tablesync/core/timestamp.hpp"


namespace tablesync::lan {

// ===============================================
// DEVICE TYPE (as announced to the LAN host)
// ===============================================
enum class DeviceType : std::uint8_t {
    Pos,
    Kds,
    Bds,
    Manager
};

[[nodiscard]]
inline constexpr std::string_view to_string(DeviceType t) noexcept {
    switch (t) {
        case DeviceType::Pos:     return "pos";
        case DeviceType::Kds:     return "kds";
        case DeviceType::Bds:     return "bds";
        case DeviceType::Manager: return "manager";
        default:                  return "unknown";
    }
}

// ===============================================
// A device attached to the local server
// ===============================================
struct ClientInfo {
    std::string client_id;
    DeviceType device_type{DeviceType::Kds};
    std::string ip_address;
    core::Timestamp connected_at{};
};

// ===============================================
// Host announced by the local server
// ===============================================
struct ServerInfo {
    std::string server_id;
    std::string address;
    std::uint16_t port = 0;
    std::string tenant_id;
};

// ===============================================
// Result of a client-side connection attempt
// ===============================================
struct ClientStatus {
    bool is_connected = false;
    std::string server_address;
    ServerInfo server_info;
    DeviceType device_type{DeviceType::Kds};
    core::Timestamp connected_at{};
};

} // namespace tablesync::lan
