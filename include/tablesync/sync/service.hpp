#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "tablesync/core/timestamp.hpp"
#include "tablesync/core/telemetry.hpp"
#include "tablesync/core/timer/clock.hpp"
#include "tablesync/core/timer/scheduler.hpp"
#include "tablesync/core/transport/cloud_channel.hpp"
#include "tablesync/core/transport/cloud/signal.hpp"
#include "tablesync/core/transport/telemetry/cloud.hpp"
#include "tablesync/core/transport/websocket_concept.hpp"
#include "tablesync/core/protocol/message.hpp"
#include "tablesync/core/protocol/redaction.hpp"
#include "tablesync/core/protocol/parser/router.hpp"
#include "tablesync/domain/kitchen_board.hpp"
#include "tablesync/lan/lan_channel_concept.hpp"
#include "tablesync/sync/broadcaster.hpp"
#include "tablesync/sync/config.hpp"
#include "tablesync/sync/dedup_cache.hpp"
#include "tablesync/sync/events.hpp"
#include "tablesync/sync/status.hpp"
#include "tablesync/sync/telemetry.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"


namespace tablesync::sync {

// Transport a frame or event came from
enum class Origin : std::uint8_t {
    Cloud,
    Lan
};

[[nodiscard]]
inline constexpr std::string_view to_string(Origin o) noexcept {
    return o == Origin::Cloud ? "cloud" : "LAN";
}

/*
===============================================================================
 tablesync::sync::SyncService
===============================================================================

Keeps one restaurant terminal in sync with its peers over two paths:

  • the cloud relay   : one WebSocket per tenant (CloudChannel<WS, Clock>)
  • the local network : a LAN collaborator hosting or joining a local server

Every dependency is injected: the WebSocket transport type, the LAN
collaborator (by reference, owned by the caller) and the clock driving the
single timer Scheduler. Several independent instances may coexist.

-------------------------------------------------------------------------------
 Lifecycle
-------------------------------------------------------------------------------
  initialize(tenant, callbacks)
      - derives the role (LAN server for POS / manager, client otherwise)
      - binds the callback registry onto the typed emitters
      - starts the cloud connection and the LAN role
  poll()
      - fires due timers, drains cloud frames, cloud signals, LAN events
  shutdown()
      - closes the cloud socket (normal close), stops or leaves the LAN,
        cancels every timer, clears dedup cache, board, tenant and
        callbacks. Nothing fires after it returns.

-------------------------------------------------------------------------------
 Inbound
-------------------------------------------------------------------------------
  frame -> Router -> protocol::Message -> exhaustive std::visit
  Order-bearing messages pass through the DedupCache first; the kitchen
  board is updated before events are emitted.

-------------------------------------------------------------------------------
 Outbound
-------------------------------------------------------------------------------
  broadcast_*() serializes immediately. A closed cloud socket triggers one
  connect() and the send waits on the SendGate (500 ms x 6 by default);
  a still-closed socket drops the frame. Orders and status updates also fan
  out over LAN when this device hosts the server with at least one client.
  The optional completion receives {cloud, lan}.

Single-threaded: every method must be called from the poll() thread.
===============================================================================
*/
template <
    core::transport::WebSocketConcept WS,
    lan::LanChannelConcept Lan,
    core::timer::ClockConcept Clock = core::timer::SteadyClock
>
class SyncService {
    using Error = core::transport::Error;
    using Result = core::protocol::parser::Result;
    using Signal = core::transport::cloud::Signal;

public:
    SyncService(Lan& lan, const Clock& clock, SyncConfig config = SyncConfig{})
        : config_(std::move(config))
        , lan_(lan)
        , scheduler_(clock)
        , cloud_(scheduler_, cloud_telemetry_, config_.reconnect, config_.heartbeat_interval)
        , dedup_(scheduler_, config_.dedup_ttl)
        , gate_(scheduler_, config_.send_retry)
    {
        cloud_.set_message_handler([this](std::string_view raw) {
            on_frame_(raw, Origin::Cloud);
        });
    }

    SyncService(const SyncService&) = delete;
    SyncService& operator=(const SyncService&) = delete;

    ~SyncService() {
        shutdown();
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // A second call tears the previous session down first.
    [[nodiscard]]
    inline Error initialize(std::string_view tenant_id, SyncCallbacks callbacks = SyncCallbacks{}) {
        if (initialized_) {
            TS_INFO("[SYNC] Re-initializing, closing previous session for tenant " << role_.tenant_id);
            shutdown();
        }
        if (tenant_id.empty()) {
            TS_ERROR("[SYNC] Cannot initialize without a tenant id");
            return Error::InvalidState;
        }
        TS_INFO("[SYNC] Initializing for tenant: " << tenant_id << " (mode " << to_string(config_.device_mode) << ")");

        role_ = make_role_context(tenant_id, config_.device_mode, lan_.available());
        binding_.bind(events_, callbacks);
        initialized_ = true;

        // Cloud (primary)
        const Error err = cloud_.set_endpoint(config_.cloud_ws_base, tenant_id);
        if (err != Error::None) {
            report_error_(ErrorPath::Cloud, err, "Invalid cloud endpoint");
        } else {
            (void)cloud_.connect(); // failures are reported through channel signals
        }

        // LAN (fallback)
        setup_lan_();
        return err;
    }

    inline void shutdown() noexcept {
        if (!initialized_) {
            return;
        }
        TS_INFO("[SYNC] Shutting down (tenant " << role_.tenant_id << ")");

        gate_.cancel_all();
        cloud_.close();
        cloud_.clear_endpoint();
        Signal sig;
        while (cloud_.poll_signal(sig)) {
            // stale edges of the closed session
        }
        stop_lan_();

        dedup_.clear();
        board_.clear();
        scheduler_.clear();
        binding_.unbind();

        role_ = RoleContext{};
        cloud_notified_ = ConnectionState::Disconnected;
        initialized_ = false;
    }

    // Drives timers and transports. Returns the amount of work done.
    inline std::size_t poll() {
        std::size_t work = scheduler_.poll();
        cloud_.poll();

        Signal sig;
        while (cloud_.poll_signal(sig)) {
            handle_signal_(sig);
            ++work;
        }

        lan::Event ev;
        while (lan_.poll_event(ev)) {
            ++work;
            TS_TL1( telemetry_.lan_events_total.inc() );
            if (!initialized_) {
                TS_TRACE("[SYNC] LAN event dropped (not initialized)");
                continue;
            }
            handle_lan_event_(ev);
        }
        return work;
    }

    // -------------------------------------------------------------------------
    // Broadcast API: orders
    // -------------------------------------------------------------------------

    inline void broadcast_order(const schema::order::Order& order,
                                const schema::order::KitchenOrder& kitchen_order,
                                BroadcastCompletion done = {}) {
        // Our own echo must not be applied again
        const std::string& id = schema::order::dedup_id(order, kitchen_order);
        if (!id.empty()) {
            dedup_.mark(id);
        }
        send_(schema::order::Broadcast{order, kitchen_order}.to_json(), "order",
              [this, order, kitchen_order]() -> std::size_t {
                  if (!lan_fanout_allowed_()) {
                      return 0;
                  }
                  const std::size_t reached = lan_.broadcast_order(order, kitchen_order);
                  if (reached > 0) {
                      TS_INFO("[SYNC] Order broadcast to " << reached << " LAN client(s)");
                  }
                  return reached;
              },
              std::move(done));
    }

    inline void broadcast_status_update(const schema::order::StatusUpdate& update, BroadcastCompletion done = {}) {
        send_(update.to_json(), "status_update",
              [this, order_id = update.order_id, status = update.status]() -> std::size_t {
                  if (!lan_fanout_allowed_()) {
                      return 0;
                  }
                  const Error err = lan_.broadcast_order_status(order_id, status);
                  if (err != Error::None) {
                      TS_WARN("[SYNC] LAN status broadcast failed (" << core::transport::to_string(err) << ")");
                      return 0;
                  }
                  return lan_clients_;
              },
              std::move(done));
    }

    inline void broadcast_item_status_update(const schema::order::ItemStatusUpdate& update, BroadcastCompletion done = {}) {
        send_(update.to_json(), "item_status_update", {}, std::move(done));
    }

    inline void broadcast_item_ready(const schema::order::ItemReady& ready, BroadcastCompletion done = {}) {
        send_(ready.to_json(), "item_ready", {}, std::move(done));
    }

    // -------------------------------------------------------------------------
    // Broadcast API: staff (credentials never leave the device)
    // -------------------------------------------------------------------------

    inline void broadcast_staff_sync(const std::vector<schema::staff::Member>& staff, BroadcastCompletion done = {}) {
        schema::staff::Sync msg;
        msg.staff = core::protocol::redaction::redact_members(staff);
        msg.timestamp = core::to_iso8601(core::now_utc());
        TS_DEBUG("[SYNC] Staff sync broadcast: " << staff.size() << " member(s)");
        send_(msg.to_json(), "staff_sync", {}, std::move(done));
    }

    inline void broadcast_staff_added(const schema::staff::Member& member, BroadcastCompletion done = {}) {
        schema::staff::Added msg{core::protocol::redaction::redact_member(member)};
        send_(msg.to_json(), "staff_added", {}, std::move(done));
    }

    inline void broadcast_staff_updated(std::string_view staff_id, const schema::RawJson& updates, BroadcastCompletion done = {}) {
        schema::staff::Updated msg{std::string{staff_id}, core::protocol::redaction::redact_updates(updates)};
        send_(msg.to_json(), "staff_updated", {}, std::move(done));
    }

    inline void broadcast_staff_removed(std::string_view staff_id, BroadcastCompletion done = {}) {
        schema::staff::Removed msg{std::string{staff_id}};
        send_(msg.to_json(), "staff_removed", {}, std::move(done));
    }

    // -------------------------------------------------------------------------
    // Broadcast API: floor plan
    // -------------------------------------------------------------------------

    inline void broadcast_floor_plan_sync(std::vector<schema::floorplan::Section> sections,
                                          std::vector<schema::floorplan::Table> tables,
                                          std::vector<schema::floorplan::Assignment> assignments,
                                          BroadcastCompletion done = {}) {
        schema::floorplan::Sync msg;
        msg.sections = std::move(sections);
        msg.tables = std::move(tables);
        msg.assignments = std::move(assignments);
        msg.timestamp = core::to_iso8601(core::now_utc());
        send_(msg.to_json(), "floorplan_sync", {}, std::move(done));
    }

    inline void broadcast_section_added(const schema::floorplan::Section& section, BroadcastCompletion done = {}) {
        send_(schema::floorplan::SectionAdded{section}.to_json(), "section_added", {}, std::move(done));
    }

    inline void broadcast_section_removed(std::string_view section_id, BroadcastCompletion done = {}) {
        send_(schema::floorplan::SectionRemoved{std::string{section_id}}.to_json(), "section_removed", {}, std::move(done));
    }

    inline void broadcast_table_added(const schema::floorplan::Table& table, BroadcastCompletion done = {}) {
        send_(schema::floorplan::TableAdded{table}.to_json(), "table_added", {}, std::move(done));
    }

    inline void broadcast_table_removed(std::string_view table_id, BroadcastCompletion done = {}) {
        send_(schema::floorplan::TableRemoved{std::string{table_id}}.to_json(), "table_removed", {}, std::move(done));
    }

    inline void broadcast_table_status_updated(std::string_view table_id, std::string_view status, BroadcastCompletion done = {}) {
        schema::floorplan::TableStatusUpdated msg{std::string{table_id}, std::string{status}};
        send_(msg.to_json(), "table_status_updated", {}, std::move(done));
    }

    inline void broadcast_staff_assigned(const schema::floorplan::Assignment& assignment, BroadcastCompletion done = {}) {
        send_(schema::floorplan::StaffAssigned{assignment}.to_json(), "staff_assigned", {}, std::move(done));
    }

    // -------------------------------------------------------------------------
    // Broadcast API: service requests
    // -------------------------------------------------------------------------

    inline void broadcast_service_request(const schema::service::Request& request, BroadcastCompletion done = {}) {
        send_(schema::service::Created{request}.to_json(), "service_request", {}, std::move(done));
    }

    inline void broadcast_service_request_ack(std::string_view request_id, std::string_view staff_id,
                                              std::string_view staff_name, BroadcastCompletion done = {}) {
        schema::service::Acknowledged msg{std::string{request_id}, std::string{staff_id}, std::string{staff_name}};
        send_(msg.to_json(), "service_request_acknowledged", {}, std::move(done));
    }

    inline void broadcast_service_request_resolved(std::string_view request_id, BroadcastCompletion done = {}) {
        send_(schema::service::Resolved{std::string{request_id}}.to_json(), "service_request_resolved", {}, std::move(done));
    }

    // -------------------------------------------------------------------------
    // Pull
    // -------------------------------------------------------------------------

    // Asks connected peers for their state. Only sent on an open socket.
    inline bool request_sync() {
        if (!cloud_.is_open()) {
            TS_DEBUG("[SYNC] request_sync skipped: cloud not connected");
            return false;
        }
        const bool sent = cloud_.send(schema::system::RequestSync{}.to_json());
        if (sent) {
            TS_INFO("[SYNC] Requesting sync from connected devices");
            TS_TL1( telemetry_.cloud_sends_total.inc() );
        }
        return sent;
    }

    // -------------------------------------------------------------------------
    // Status
    // -------------------------------------------------------------------------

    [[nodiscard]] inline ConnectionState cloud_state() const noexcept { return cloud_.state(); }
    [[nodiscard]] inline ConnectionState lan_state() const noexcept { return lan_state_; }

    [[nodiscard]]
    inline ConnectionState connection_status() const noexcept {
        return aggregate_status(cloud_.state(), lan_state_);
    }

    [[nodiscard]]
    inline SyncPath active_sync_path() const noexcept {
        return active_path(cloud_.state(), lan_state_);
    }

    [[nodiscard]]
    inline DetailedStatus detailed_status() const noexcept {
        DetailedStatus s;
        s.cloud.status = cloud_.state();
        s.cloud.reconnect_attempts = cloud_.reconnect_attempts();
        s.lan.status = lan_state_;
        s.lan.is_server = role_.is_server;
        s.lan.server_running = lan_server_running_;
        s.lan.connected_clients = lan_clients_;
        s.active_path = active_sync_path();
        return s;
    }

    [[nodiscard]] inline bool is_cloud_connected() const noexcept { return cloud_.is_open(); }
    [[nodiscard]] inline bool is_lan_connected() const noexcept { return lan_state_ == ConnectionState::Connected; }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] inline SyncEvents& events() noexcept { return events_; }
    [[nodiscard]] inline const domain::KitchenBoard& board() const noexcept { return board_; }
    [[nodiscard]] inline const RoleContext& role() const noexcept { return role_; }
    [[nodiscard]] inline const SyncConfig& config() const noexcept { return config_; }
    [[nodiscard]] inline bool initialized() const noexcept { return initialized_; }
    [[nodiscard]] inline const core::timer::Scheduler<Clock>& scheduler() const noexcept { return scheduler_; }
    [[nodiscard]] inline const DedupCache<Clock>& dedup() const noexcept { return dedup_; }
    [[nodiscard]] inline std::size_t pending_sends() const noexcept { return gate_.pending(); }
    [[nodiscard]] inline const core::transport::telemetry::Cloud& cloud_telemetry() const noexcept { return cloud_telemetry_; }
    [[nodiscard]] inline const telemetry::Sync& telemetry() const noexcept { return telemetry_; }

    [[nodiscard]] inline core::transport::CloudChannel<WS, Clock>& cloud() noexcept { return cloud_; }

private:
    SyncConfig config_;
    Lan& lan_;

    // Declared before every component that arms timers
    core::timer::Scheduler<Clock> scheduler_;

    core::transport::telemetry::Cloud cloud_telemetry_;
    telemetry::Sync telemetry_;

    core::transport::CloudChannel<WS, Clock> cloud_;
    DedupCache<Clock> dedup_;
    SendGate<Clock> gate_;
    core::protocol::parser::Router router_;
    domain::KitchenBoard board_;

    SyncEvents events_;
    CallbackBinding binding_;

    RoleContext role_;
    bool initialized_ = false;

    // Cloud state as last notified (follows channel signals)
    ConnectionState cloud_notified_ = ConnectionState::Disconnected;

    // LAN state (owned here, fed by collaborator results and events)
    ConnectionState lan_state_ = ConnectionState::Disconnected;
    bool lan_server_running_ = false;
    std::size_t lan_clients_ = 0;

private:
    // =========================================================================
    // Outbound
    // =========================================================================

    using LanFanout = std::function<std::size_t()>;

    inline void send_(std::string frame, std::string_view what, LanFanout lan_fanout, BroadcastCompletion done) {
        TS_TL1( telemetry_.broadcasts_total.inc() );
        if (!cloud_.is_open() && cloud_.has_endpoint()) {
            TS_INFO("[SYNC] Cloud not connected for " << what << " broadcast, attempting reconnect...");
            (void)cloud_.connect();
        }
        typename SendGate<Clock>::Ready ready;
        if (cloud_.has_endpoint()) {
            ready = [this]() { return cloud_.is_open(); };
        }
        gate_.run_when(std::move(ready),
            [this, frame = std::move(frame), what, lan_fanout = std::move(lan_fanout), done = std::move(done)]() {
                BroadcastResult result;
                if (cloud_.is_open()) {
                    result.cloud = cloud_.send(frame);
                }
                if (result.cloud) {
                    TS_TL1( telemetry_.cloud_sends_total.inc() );
                    TS_DEBUG("[SYNC] " << what << " broadcast sent via cloud");
                } else {
                    TS_TL1( telemetry_.cloud_sends_dropped_total.inc() );
                    TS_WARN("[SYNC] Cloud not connected, " << what << " broadcast not sent (state: "
                            << core::transport::to_string(cloud_.state()) << ")");
                }
                if (lan_fanout) {
                    result.lan = lan_fanout();
                    TS_TL1( telemetry_.lan_clients_reached_total.inc(result.lan) );
                }
                if (done) {
                    done(result);
                }
            });
    }

    [[nodiscard]]
    inline bool lan_fanout_allowed_() const noexcept {
        return role_.lan_role == LanRole::Server && lan_server_running_ && lan_clients_ > 0;
    }

    // =========================================================================
    // Inbound frames
    // =========================================================================

    inline void on_frame_(std::string_view raw, Origin origin) {
        TS_TL1( telemetry_.frames_received_total.inc() );
        core::protocol::Message msg;
        const Result r = router_.parse(raw, msg);
        if (r == Result::Ignored) {
            TS_TL1( telemetry_.frames_ignored_total.inc() );
            return;
        }
        if (r != Result::Parsed) {
            TS_TL1( telemetry_.frames_malformed_total.inc() );
            TS_DEBUG("[SYNC] Dropped " << to_string(origin) << " frame (" << core::protocol::parser::to_string(r) << ")");
            return;
        }
        if (dispatch_(msg, origin) == Result::Delivered) {
            TS_TL1( telemetry_.messages_applied_total.inc() );
        }
    }

    [[nodiscard]]
    inline Result dispatch_(const core::protocol::Message& msg, Origin origin) {
        using core::protocol::overloaded;
        return std::visit(overloaded{
            [](const std::monostate&) {
                return Result::Ignored;
            },
            // --- Orders ---
            [&](const schema::order::Created& m) {
                return apply_order_created_(m.order, m.kitchen_order, origin);
            },
            [&](const schema::order::StatusUpdate& m) {
                return apply_status_update_(m);
            },
            [&](const schema::order::ItemStatusUpdate& m) {
                TS_DEBUG("[SYNC] Item status update: " << m.order_id << "/" << m.item_id << " -> " << m.status);
                board_.update_item_status(m.order_id, m.item_id, m.status);
                events_.item_status_update.emit(m);
                return Result::Delivered;
            },
            [&](const schema::order::SyncState& m) {
                return origin == Origin::Cloud ? apply_snapshot_(m) : apply_lan_snapshot_(m);
            },
            [&](const schema::order::QrCreated& m) {
                const std::string& id = m.id();
                if (!dedup_.insert(id)) {
                    TS_INFO("[SYNC] Skipping duplicate QR order: " << id);
                    TS_TL1( telemetry_.duplicates_dropped_total.inc() );
                    return Result::Duplicate;
                }
                TS_INFO("[SYNC] QR order created: " << id << " for table " << lcr::to_string(m.table_info.table_number));
                if (!m.kitchen_order.id.empty()) {
                    board_.add_order(m.kitchen_order);
                }
                events_.qr_order_created.emit(m.order, m.table_info, m.kitchen_order);
                events_.order_created.emit(m.order, m.kitchen_order);
                return Result::Delivered;
            },
            [&](const schema::order::ItemReady& m) {
                TS_DEBUG("[SYNC] Item ready: " << m.item_name << " for order " << m.order_number);
                events_.item_ready.emit(m);
                return Result::Delivered;
            },
            // --- Staff ---
            [&](const schema::staff::Sync& m) {
                TS_DEBUG("[SYNC] Staff sync: " << m.staff.size() << " member(s)");
                events_.staff_sync.emit(m.staff);
                return Result::Delivered;
            },
            [&](const schema::staff::Added& m) {
                events_.staff_added.emit(m.staff);
                return Result::Delivered;
            },
            [&](const schema::staff::Updated& m) {
                events_.staff_updated.emit(m.staff_id, m.updates);
                return Result::Delivered;
            },
            [&](const schema::staff::Removed& m) {
                events_.staff_removed.emit(m.staff_id);
                return Result::Delivered;
            },
            // --- Floor plan ---
            [&](const schema::floorplan::Sync& m) {
                TS_DEBUG("[SYNC] Floor plan sync: " << m.sections.size() << " section(s), " << m.tables.size() << " table(s)");
                events_.floor_plan_sync.emit(m);
                return Result::Delivered;
            },
            [&](const schema::floorplan::SectionAdded& m) {
                events_.section_added.emit(m.section);
                return Result::Delivered;
            },
            [&](const schema::floorplan::SectionRemoved& m) {
                events_.section_removed.emit(m.section_id);
                return Result::Delivered;
            },
            [&](const schema::floorplan::TableAdded& m) {
                events_.table_added.emit(m.table);
                return Result::Delivered;
            },
            [&](const schema::floorplan::TableRemoved& m) {
                events_.table_removed.emit(m.table_id);
                return Result::Delivered;
            },
            [&](const schema::floorplan::TableStatusUpdated& m) {
                events_.table_status_updated.emit(m.table_id, m.status);
                return Result::Delivered;
            },
            [&](const schema::floorplan::StaffAssigned& m) {
                events_.staff_assigned.emit(m.assignment);
                return Result::Delivered;
            },
            // --- Service requests ---
            [&](const schema::service::Created& m) {
                TS_DEBUG("[SYNC] Service request: " << m.request.type << " for table " << lcr::to_string(m.request.table_number));
                events_.service_request.emit(m.request);
                return Result::Delivered;
            },
            [&](const schema::service::Acknowledged& m) {
                events_.service_request_acknowledged.emit(m.request_id, m.staff_id, m.staff_name);
                return Result::Delivered;
            },
            [&](const schema::service::Resolved& m) {
                events_.service_request_resolved.emit(m.request_id);
                return Result::Delivered;
            },
            // --- Control ---
            [&](const schema::system::SyncRequested& m) {
                TS_INFO("[SYNC] Sync requested by: " << m.requester_id << " (" << m.device_type << ")");
                events_.sync_requested.emit(m.requester_id, m.device_type);
                return Result::Delivered;
            },
            [&](const schema::system::Pong&) {
                cloud_.on_pong();
                return Result::Delivered;
            }
        }, msg);
    }

    [[nodiscard]]
    inline Result apply_order_created_(const schema::order::Order& order,
                                       const schema::order::KitchenOrder& kitchen_order,
                                       Origin origin) {
        const std::string& id = schema::order::dedup_id(order, kitchen_order);
        if (!id.empty() && !dedup_.insert(id)) {
            TS_INFO("[SYNC] Skipping duplicate order from " << to_string(origin) << ": " << id);
            TS_TL1( telemetry_.duplicates_dropped_total.inc() );
            return Result::Duplicate;
        }
        TS_INFO("[SYNC] Order created via " << to_string(origin) << ": " << id);
        if (!kitchen_order.id.empty()) {
            board_.add_order(kitchen_order);
        }
        events_.order_created.emit(order, kitchen_order);
        return Result::Delivered;
    }

    // TODO: conflicting updates for one order from two devices resolve as last
    // write observed; compare producer timestamps once the relay forwards them.
    [[nodiscard]]
    inline Result apply_status_update_(const schema::order::StatusUpdate& update) {
        TS_DEBUG("[SYNC] Status update: " << update.order_id << " -> " << update.status);
        if (update.status == "completed") {
            board_.move_to_completed(update.order_id);
        } else {
            board_.update_status(update.order_id, update.status);
        }
        events_.order_status_update.emit(update);
        return Result::Delivered;
    }

    // Cloud snapshot replaces the active set
    [[nodiscard]]
    inline Result apply_snapshot_(const schema::order::SyncState& state) {
        TS_INFO("[SYNC] Sync state: " << state.active_orders.size() << " active order(s)");
        board_.set_active_orders(state.active_orders);
        events_.sync_state.emit(state.active_orders);
        return Result::Delivered;
    }

    // LAN snapshot adds the orders not seen within the dedup window
    [[nodiscard]]
    inline Result apply_lan_snapshot_(const schema::order::SyncState& state) {
        TS_INFO("[SYNC] LAN sync state: " << state.active_orders.size() << " order(s)");
        std::vector<schema::order::KitchenOrder> accepted;
        for (const auto& ko : state.active_orders) {
            if (ko.id.empty()) {
                continue;
            }
            if (!dedup_.insert(ko.id)) {
                TS_TL1( telemetry_.duplicates_dropped_total.inc() );
                continue;
            }
            board_.add_order(ko);
            accepted.push_back(ko);
        }
        events_.sync_state.emit(accepted);
        return Result::Delivered;
    }

    // =========================================================================
    // Cloud signals
    // =========================================================================

    inline void handle_signal_(Signal sig) {
        switch (sig) {
            case Signal::Connecting:
                set_cloud_state_(ConnectionState::Connecting);
                break;
            case Signal::Connected:
                set_cloud_state_(ConnectionState::Connected);
                (void)request_sync();
                break;
            case Signal::Disconnected:
                set_cloud_state_(ConnectionState::Disconnected);
                break;
            case Signal::TransportError:
                report_error_(ErrorPath::Cloud, cloud_.last_error(), "Cloud WebSocket error");
                break;
            case Signal::RetriesExhausted:
                TS_WARN("[SYNC] Max cloud reconnect attempts reached, falling back to LAN only");
                break;
            case Signal::RetryScheduled:
            case Signal::None:
            default:
                break;
        }
    }

    // =========================================================================
    // LAN
    // =========================================================================

    inline void setup_lan_() {
        switch (role_.lan_role) {
            case LanRole::None:
                TS_INFO("[SYNC] LAN not available on this host, cloud only");
                return;
            case LanRole::Server: {
                TS_INFO("[SYNC] Starting LAN server for tenant: " << role_.tenant_id);
                std::string address;
                const Error err = lan_.start_server(role_.tenant_id, address);
                if (err != Error::None) {
                    report_error_(ErrorPath::Lan, err, "Failed to start LAN server");
                    return;
                }
                TS_INFO("[SYNC] LAN server started at: " << address);
                lan_server_running_ = true;
                set_lan_state_(ConnectionState::Connected); // a running server counts as connected
                return;
            }
            case LanRole::Client: {
                const auto device_type = lan_device_type(config_.device_mode);
                TS_INFO("[SYNC] Auto-connecting to LAN host as " << lan::to_string(device_type) << "...");
                lcr::optional<lan::ClientStatus> status;
                const Error err = lan_.connect_as_client(device_type, role_.tenant_id, status);
                if (err != Error::None) {
                    set_lan_state_(ConnectionState::Disconnected);
                    report_error_(ErrorPath::Lan, err, "LAN connection failed");
                    return;
                }
                if (status.has() && status.value().is_connected) {
                    TS_INFO("[SYNC] Connected to LAN host " << status.value().server_address);
                    set_lan_state_(ConnectionState::Connected);
                } else {
                    set_lan_state_(ConnectionState::Disconnected);
                    report_error_(ErrorPath::Lan, Error::ConnectionFailed, "No LAN host found, using cloud only");
                }
                return;
            }
        }
    }

    inline void stop_lan_() noexcept {
        Error err = Error::None;
        if (role_.lan_role == LanRole::Server && lan_server_running_) {
            err = lan_.stop_server();
        } else if (role_.lan_role == LanRole::Client) {
            err = lan_.disconnect();
        }
        if (err != Error::None) {
            TS_WARN("[SYNC] Failed to stop LAN sync (" << core::transport::to_string(err) << ")");
        }
        lan_server_running_ = false;
        lan_clients_ = 0;
        lan_state_ = ConnectionState::Disconnected;
    }

    inline void handle_lan_event_(const lan::Event& ev) {
        using core::protocol::overloaded;
        std::visit(overloaded{
            [](const std::monostate&) {},
            [this](const lan::event::OrderCreated& e) {
                if (apply_order_created_(e.order, e.kitchen_order, Origin::Lan) == Result::Delivered) {
                    TS_TL1( telemetry_.messages_applied_total.inc() );
                }
            },
            [this](const lan::event::OrderStatusUpdate& e) {
                schema::order::StatusUpdate update;
                update.order_id = e.order_id;
                update.status = e.status;
                (void)apply_status_update_(update);
            },
            [this](const lan::event::SyncState& e) {
                (void)apply_lan_snapshot_(e);
            },
            [this](const lan::event::Connected& e) {
                TS_INFO("[SYNC] LAN connected to host " << e.status.server_address);
                set_lan_state_(ConnectionState::Connected);
            },
            [this](const lan::event::Disconnected&) {
                TS_INFO("[SYNC] LAN disconnected from host");
                set_lan_state_(ConnectionState::Disconnected);
            },
            [this](const lan::event::ClientConnected& e) {
                ++lan_clients_;
                TS_INFO("[SYNC] LAN client connected: " << lan::to_string(e.client.device_type)
                        << " (" << lan_clients_ << " total)");
            },
            [this](const lan::event::ClientDisconnected& e) {
                if (lan_clients_ > 0) {
                    --lan_clients_;
                }
                TS_INFO("[SYNC] LAN client disconnected: " << e.client_id << " (" << lan_clients_ << " left)");
            }
        }, ev);
    }

    // =========================================================================
    // Status notification
    // =========================================================================

    inline void set_cloud_state_(ConnectionState s) {
        if (cloud_notified_ == s) {
            return;
        }
        cloud_notified_ = s;
        notify_connection_change_();
    }

    inline void set_lan_state_(ConnectionState s) {
        if (lan_state_ == s) {
            return;
        }
        lan_state_ = s;
        notify_connection_change_();
    }

    inline void notify_connection_change_() {
        const auto status = aggregate_status(cloud_notified_, lan_state_);
        const auto path = active_path(cloud_notified_, lan_state_);
        TS_TL1( telemetry_.status_changes_total.inc() );
        TS_DEBUG("[SYNC] Connection status: " << core::transport::to_string(status) << " via " << to_string(path));
        events_.connection_change.emit(status, path);
    }

    inline void report_error_(ErrorPath path, Error code, std::string_view message) {
        TS_ERROR("[SYNC] " << to_string(path) << " error: " << message << " (" << core::transport::to_string(code) << ")");
        events_.error.emit(SyncError{path, code, std::string{message}});
    }
};

} // namespace tablesync::sync
