#include "tablesync/sync/status.hpp"

#include "lcr/json.hpp"


namespace tablesync::sync {

std::string DetailedStatus::to_json() const {
    std::string out;
    out.reserve(192);
    out += "{\"cloud\":{";
    lcr::json::append_field(out, "status", core::transport::to_string(cloud.status), true);
    out += ",\"reconnectAttempts\":";
    lcr::json::append(out, cloud.reconnect_attempts);
    out += "},\"lan\":{";
    lcr::json::append_field(out, "status", core::transport::to_string(lan.status), true);
    out += ",\"isServer\":";
    out += lan.is_server ? "true" : "false";
    out += ",\"serverRunning\":";
    out += lan.server_running ? "true" : "false";
    out += ",\"connectedClients\":";
    lcr::json::append(out, lan.connected_clients);
    out += '}';
    lcr::json::append_field(out, "activePath", to_string(active_path));
    out += '}';
    return out;
}

std::ostream& operator<<(std::ostream& os, const DetailedStatus& status) {
    os << "cloud=" << core::transport::to_string(status.cloud.status)
       << " (attempts " << status.cloud.reconnect_attempts << ")"
       << " lan=" << core::transport::to_string(status.lan.status)
       << (status.lan.is_server ? " [server" : " [client")
       << (status.lan.server_running ? ", running" : "")
       << ", " << status.lan.connected_clients << " client(s)]"
       << " path=" << to_string(status.active_path);
    return os;
}

} // namespace tablesync::sync
