#pragma once

#include <string>


namespace tablesync::core::protocol::schema {
namespace system {

// ===============================================
// sync_requested (a peer asks for a snapshot)
// ===============================================
struct SyncRequested {
    std::string requester_id;
    std::string device_type;
};

// ===============================================
// pong (heartbeat reply)
// ===============================================
struct Pong {
};

// ===============================================
// OUTBOUND: request_sync / ping
// ===============================================
struct RequestSync {
    [[nodiscard]] inline std::string to_json() const { return R"({"type":"request_sync"})"; }
};

struct Ping {
    [[nodiscard]] inline std::string to_json() const { return R"({"type":"ping"})"; }
};

} // namespace system
} // namespace tablesync::core::protocol::schema
