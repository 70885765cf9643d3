#pragma once

#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "tablesync/sync/config.hpp"
#include "lcr/log/logger.hpp"

namespace tablesync::examples::cli {

struct NodeParams {
    std::string url       = std::string{sync::DEFAULT_CLOUD_WS_BASE};
    std::string tenant    = "demo";
    std::string mode      = "kds";
    int duration_sec      = 0;      // 0 = until Ctrl+C
    std::string log_level = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  URL       : " << url << "\n"
           << "  Tenant    : " << tenant << "\n"
           << "  Mode      : " << mode << "\n"
           << "  Duration  : " << (duration_sec > 0 ? std::to_string(duration_sec) + " s" : "until Ctrl+C") << "\n"
           << "  Log Level : " << log_level << "\n";
    }

    [[nodiscard]]
    inline sync::SyncConfig to_config() const {
        sync::SyncConfig config;
        config.cloud_ws_base = url;
        (void)sync::parse_device_mode(mode, config.device_mode); // validated by CLI
        return config;
    }
};

[[nodiscard]]
inline NodeParams configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    NodeParams params{};

    app.add_option("--url", params.url, "Order relay base URL")
        ->envname("TABLESYNC_ORDERS_WS_URL")
        ->check(ws_url_validator)
        ->default_val(params.url);
    app.add_option("-t,--tenant", params.tenant, "Tenant (restaurant) id")->check(tenant_validator)->default_val(params.tenant);
    app.add_option("-m,--mode", params.mode, "Device mode: pos | manager | kds | bds | service | aggregator")
        ->check(device_mode_validator)
        ->default_val(params.mode);
    app.add_option("-d,--duration", params.duration_sec, "Run time in seconds (0 = until Ctrl+C)")
        ->check(CLI::NonNegativeNumber)
        ->default_val(params.duration_sec);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->default_val(params.log_level);

    app.footer(
        "Joins the tenant's order relay and prints every synchronized event.\n"
        "The endpoint can also be set through TABLESYNC_ORDERS_WS_URL."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    lcr::log::Logger::instance().set_level(params.log_level);
    return params;
}

} // namespace tablesync::examples::cli
