#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "tablesync/sync/config.hpp"


namespace tablesync::examples::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("ws://", 0) == 0 || value.rfind("wss://", 0) == 0) {
            return {};
        }
        return "URL must start with ws:// or wss://";
    },
    "WebSocket URL validator"
);


// -------------------------------------------------------------
// Device mode validator
// -------------------------------------------------------------
inline auto device_mode_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        sync::DeviceMode mode;
        if (sync::parse_device_mode(value, mode)) {
            return {};
        }
        return "Mode must be one of: pos, manager, kds, bds, service, aggregator";
    },
    "Device mode validator"
);


// -------------------------------------------------------------
// Tenant id validator
// -------------------------------------------------------------
inline auto tenant_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.empty()) {
            return "Tenant id must not be empty";
        }
        if (value.find('/') != std::string::npos) {
            return "Tenant id must not contain '/'";
        }
        return {};
    },
    "Tenant id validator"
);

} // namespace tablesync::examples::cli
