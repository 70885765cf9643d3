#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>


namespace tablesync::core::protocol {

// ===============================================
// WIRE MESSAGE TYPE (value of the "type" field)
// ===============================================
enum class MessageType : std::uint8_t {
    // --- Orders ---
    OrderCreated,
    OrderStatusUpdate,
    ItemStatusUpdate,
    SyncState,
    QrOrderCreated,
    ItemReady,
    // --- Staff ---
    StaffSync,
    StaffAdded,
    StaffUpdated,
    StaffRemoved,
    // --- Floor plan ---
    FloorPlanSync,
    SectionAdded,
    SectionRemoved,
    TableAdded,
    TableRemoved,
    TableStatusUpdated,
    StaffAssigned,
    // --- Service requests ---
    ServiceRequest,
    ServiceRequestAcknowledged,
    ServiceRequestResolved,
    // --- Control ---
    SyncRequested,
    Pong,
    // --- Outbound only ---
    BroadcastOrder,
    StatusUpdate,
    RequestSync,
    Ping,

    Unknown
};

namespace detail {

inline constexpr std::array<std::pair<MessageType, std::string_view>, 26> MESSAGE_TYPE_NAMES{{
    {MessageType::OrderCreated,               "order_created"},
    {MessageType::OrderStatusUpdate,          "order_status_update"},
    {MessageType::ItemStatusUpdate,           "item_status_update"},
    {MessageType::SyncState,                  "sync_state"},
    {MessageType::QrOrderCreated,             "qr_order_created"},
    {MessageType::ItemReady,                  "item_ready"},
    {MessageType::StaffSync,                  "staff_sync"},
    {MessageType::StaffAdded,                 "staff_added"},
    {MessageType::StaffUpdated,               "staff_updated"},
    {MessageType::StaffRemoved,               "staff_removed"},
    {MessageType::FloorPlanSync,              "floorplan_sync"},
    {MessageType::SectionAdded,               "section_added"},
    {MessageType::SectionRemoved,             "section_removed"},
    {MessageType::TableAdded,                 "table_added"},
    {MessageType::TableRemoved,               "table_removed"},
    {MessageType::TableStatusUpdated,         "table_status_updated"},
    {MessageType::StaffAssigned,              "staff_assigned"},
    {MessageType::ServiceRequest,             "service_request"},
    {MessageType::ServiceRequestAcknowledged, "service_request_acknowledged"},
    {MessageType::ServiceRequestResolved,     "service_request_resolved"},
    {MessageType::SyncRequested,              "sync_requested"},
    {MessageType::Pong,                       "pong"},
    {MessageType::BroadcastOrder,             "broadcast_order"},
    {MessageType::StatusUpdate,               "status_update"},
    {MessageType::RequestSync,                "request_sync"},
    {MessageType::Ping,                       "ping"},
}};

} // namespace detail

[[nodiscard]]
inline constexpr std::string_view to_string(MessageType t) noexcept {
    for (const auto& [type, name] : detail::MESSAGE_TYPE_NAMES) {
        if (type == t) return name;
    }
    return "unknown";
}

[[nodiscard]]
inline constexpr MessageType message_type_from_string(std::string_view name) noexcept {
    for (const auto& [type, str] : detail::MESSAGE_TYPE_NAMES) {
        if (str == name) return type;
    }
    return MessageType::Unknown;
}

static_assert(message_type_from_string("order_created") == MessageType::OrderCreated);
static_assert(to_string(MessageType::FloorPlanSync) == "floorplan_sync");

} // namespace tablesync::core::protocol
