#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tablesync/lan/lan_channel_concept.hpp"
#include "lcr/log/logger.hpp"


namespace tablesync::lan::test {

/*
===============================================================================
 MockLan
===============================================================================

Scripted LAN collaborator.

- Results of start_server / connect_as_client are configured up front
- broadcast_order() reaches `clients` devices (only while serving)
- Events are queued by the test with push() and drained by the service
- Every call is recorded for inspection
===============================================================================
*/
class MockLan {
public:
    using Error = core::transport::Error;

    // ---------------------------------------------------------------------
    // LanChannelConcept API
    // ---------------------------------------------------------------------

    [[nodiscard]] inline bool available() const noexcept { return available_; }

    inline Error start_server(std::string_view tenant, std::string& address) noexcept {
        ++start_server_calls;
        last_tenant.assign(tenant.data(), tenant.size());
        if (start_result != Error::None) {
            return start_result;
        }
        serving = true;
        address = server_address;
        return Error::None;
    }

    inline Error stop_server() noexcept {
        ++stop_server_calls;
        serving = false;
        return Error::None;
    }

    inline Error connect_as_client(DeviceType type, std::string_view tenant, lcr::optional<ClientStatus>& status) noexcept {
        ++connect_calls;
        last_device_type = type;
        last_tenant.assign(tenant.data(), tenant.size());
        if (connect_result != Error::None) {
            return connect_result;
        }
        if (host_found) {
            ClientStatus s;
            s.is_connected = true;
            s.server_address = server_address;
            s.device_type = type;
            status = s;
        }
        return Error::None;
    }

    inline Error disconnect() noexcept {
        ++disconnect_calls;
        return Error::None;
    }

    inline std::size_t broadcast_order(const core::protocol::schema::order::Order&,
                                       const core::protocol::schema::order::KitchenOrder& kitchen_order) noexcept {
        ++broadcast_order_calls;
        last_broadcast_order_id = kitchen_order.id;
        return serving ? clients : 0;
    }

    inline Error broadcast_order_status(std::string_view order_id, std::string_view status) noexcept {
        ++broadcast_status_calls;
        last_status_order_id.assign(order_id.data(), order_id.size());
        last_status.assign(status.data(), status.size());
        return serving ? Error::None : Error::InvalidState;
    }

    inline bool poll_event(Event& out) noexcept {
        if (events_.empty()) {
            return false;
        }
        out = std::move(events_.front());
        events_.pop_front();
        return true;
    }

    // ---------------------------------------------------------------------
    // Test helpers
    // ---------------------------------------------------------------------

    inline void set_available(bool on) noexcept { available_ = on; }

    inline void push(Event ev) {
        events_.push_back(std::move(ev));
    }

    inline void push_client_connected(std::string id, DeviceType type = DeviceType::Kds) {
        ClientInfo info;
        info.client_id = std::move(id);
        info.device_type = type;
        push(event::ClientConnected{info});
    }

    inline void push_client_disconnected(std::string id) {
        push(event::ClientDisconnected{std::move(id)});
    }

    [[nodiscard]] inline std::size_t queued() const noexcept { return events_.size(); }

public:
    // Configuration
    Error start_result = Error::None;
    Error connect_result = Error::None;
    bool host_found = true;
    std::size_t clients = 0;
    std::string server_address = "192.168.1.10:8765";

    // Observed state
    bool serving = false;
    int start_server_calls = 0;
    int stop_server_calls = 0;
    int connect_calls = 0;
    int disconnect_calls = 0;
    int broadcast_order_calls = 0;
    int broadcast_status_calls = 0;
    DeviceType last_device_type{DeviceType::Pos};
    std::string last_tenant;
    std::string last_broadcast_order_id;
    std::string last_status_order_id;
    std::string last_status;

private:
    bool available_ = true;
    std::deque<Event> events_;
};

// Assert that MockLan conforms to lan::LanChannelConcept concept
static_assert(LanChannelConcept<MockLan>);

} // namespace tablesync::lan::test
