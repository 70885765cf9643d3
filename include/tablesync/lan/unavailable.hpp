#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "tablesync/lan/lan_channel_concept.hpp"


namespace tablesync::lan {

// Collaborator for hosts without local-network support (cloud only).
class Unavailable {
public:
    [[nodiscard]] inline bool available() const noexcept { return false; }

    [[nodiscard]]
    inline core::transport::Error start_server(std::string_view, std::string&) noexcept {
        return core::transport::Error::Unavailable;
    }

    [[nodiscard]]
    inline core::transport::Error stop_server() noexcept {
        return core::transport::Error::Unavailable;
    }

    [[nodiscard]]
    inline core::transport::Error connect_as_client(DeviceType, std::string_view, lcr::optional<ClientStatus>&) noexcept {
        return core::transport::Error::Unavailable;
    }

    [[nodiscard]]
    inline core::transport::Error disconnect() noexcept {
        return core::transport::Error::Unavailable;
    }

    [[nodiscard]]
    inline std::size_t broadcast_order(const core::protocol::schema::order::Order&,
                                       const core::protocol::schema::order::KitchenOrder&) noexcept {
        return 0;
    }

    [[nodiscard]]
    inline core::transport::Error broadcast_order_status(std::string_view, std::string_view) noexcept {
        return core::transport::Error::Unavailable;
    }

    [[nodiscard]]
    inline bool poll_event(Event&) noexcept {
        return false;
    }
};

static_assert(LanChannelConcept<Unavailable>);

} // namespace tablesync::lan
