#pragma once

#include <cstdint>
#include <string_view>


namespace tablesync::core::transport {

// ===============================================================
// CONNECTION STATE ENUM (one per transport: cloud, lan)
// ===============================================================
enum class ConnectionState : uint8_t {
    Disconnected,
    Connecting,
    Connected
};

// Lowercase names, also used on the status JSON surface
[[nodiscard]]
inline constexpr std::string_view to_string(ConnectionState s) noexcept {
    switch (s) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        default:                            return "unknown";
    }
}

} // namespace tablesync::core::transport
