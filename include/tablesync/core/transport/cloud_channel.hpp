#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <string_view>

#include "tablesync/core/transport/websocket_concept.hpp"
#include "tablesync/core/transport/telemetry/cloud.hpp"
#include "tablesync/core/transport/parse_url.hpp"
#include "tablesync/core/transport/state.hpp"
#include "tablesync/core/transport/backoff.hpp"
#include "tablesync/core/transport/cloud/signal.hpp"
#include "tablesync/core/transport/websocket/events.hpp"
#include "tablesync/core/timer/scheduler.hpp"
#include "tablesync/core/telemetry.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"


namespace tablesync::core::transport {

/*
===============================================================================
 tablesync::core::transport::CloudChannel
===============================================================================

One logical connection to the per-tenant cloud endpoint

    <base>/ws/orders/<tenantId>

parameterized by a WebSocket transport conforming to WebSocketConcept and
by the clock driving the shared timer Scheduler.

-------------------------------------------------------------------------------
 State machine
-------------------------------------------------------------------------------
    Disconnected --connect()--> Connecting --Open--> Connected
         ^                          |                    |
         +----------Close-----------+--------Close-------+
         |
         +-- reconnect timer --> connect()

- connect() is a no-op while Connecting/Connected, and refuses to start
  without an endpoint (no tenant). Called while a retry is armed, it
  takes that retry's place and advances the attempt counter.
- Open resets the attempt counter, increments the epoch and arms the
  heartbeat.
- Error is informational only; the Close that follows drives the state.
- Close schedules a reconnect after
      min(base * 2^attempt, max) + jitter
  unless max_attempts retries have already fired since the last open.
  Running out of attempts is not fatal: the channel stays Disconnected
  until connect() is called again.
- close() is the clean local shutdown: normal close code, all timers
  cancelled, counter reset, no reconnect.

-------------------------------------------------------------------------------
 Observability
-------------------------------------------------------------------------------
- cloud::Signal edges through poll_signal()
- epoch(): completed opens
- telemetry::Cloud counters (TS_TL1)

Poll-driven. No threads of its own; the transport may own an I/O thread
and hands events over through its own ring.
===============================================================================
*/

constexpr auto HEARTBEAT_INTERVAL = std::chrono::milliseconds(30000);
inline constexpr std::string_view ORDERS_PATH = "/ws/orders/";

// Builds <base>/ws/orders/<tenant>, tolerating a trailing '/' on base.
[[nodiscard]]
inline std::string make_orders_url(std::string_view base, std::string_view tenant_id) {
    while (!base.empty() && base.back() == '/') {
        base.remove_suffix(1);
    }
    std::string url{base};
    url += ORDERS_PATH;
    url += tenant_id;
    return url;
}

template <
    transport::WebSocketConcept WS,
    timer::ClockConcept Clock
>
class CloudChannel {
public:
    using MessageHandler = std::function<void(std::string_view)>;
    using JitterSource   = std::function<std::chrono::milliseconds()>;

    CloudChannel(timer::Scheduler<Clock>& scheduler,
                 telemetry::Cloud& telemetry,
                 ReconnectPolicy policy = ReconnectPolicy{},
                 std::chrono::milliseconds heartbeat_interval = HEARTBEAT_INTERVAL)
        : scheduler_(scheduler)
        , telemetry_(telemetry)
        , policy_(policy)
        , heartbeat_interval_(heartbeat_interval)
        , rng_(std::random_device{}())
    {
    }

    CloudChannel(const CloudChannel&) = delete;
    CloudChannel& operator=(const CloudChannel&) = delete;

    // No reconnection after object lifetime ends.
    ~CloudChannel() {
        close();
    }

    // -------------------------------------------------------------------------
    // Endpoint
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error set_endpoint(std::string_view base_url, std::string_view tenant_id) {
        clear_endpoint();
        if (tenant_id.empty()) {
            TS_WARN("[CLOUD] Empty tenant id, endpoint not set");
            return Error::InvalidUrl;
        }
        std::string url = make_orders_url(base_url, tenant_id);
        ParsedUrl parsed;
        const Error err = parse_url(url, parsed);
        if (err != Error::None) {
            TS_ERROR("[CLOUD] Invalid endpoint: " << url << " (" << to_string(err) << ")");
            return err;
        }
        url_ = std::move(url);
        parsed_url_ = std::move(parsed);
        has_endpoint_ = true;
        TS_DEBUG("[CLOUD] Endpoint: " << url_);
        return Error::None;
    }

    inline void clear_endpoint() noexcept {
        has_endpoint_ = false;
        url_.clear();
        parsed_url_ = ParsedUrl{};
    }

    [[nodiscard]] inline bool has_endpoint() const noexcept { return has_endpoint_; }
    [[nodiscard]] inline const std::string& url() const noexcept { return url_; }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Returns None when an attempt was started or one is already in progress.
    [[nodiscard]]
    inline Error connect() noexcept {
        if (state_ != ConnectionState::Disconnected) {
            TS_TRACE("[CLOUD] connect() ignored (state: " << to_string(state_) << ")");
            return Error::None;
        }
        if (!has_endpoint_) {
            TS_DEBUG("[CLOUD] connect() ignored: no tenant endpoint");
            return Error::InvalidState;
        }
        TS_TL1( telemetry_.connect_calls_total.inc() );
        // An early connect() consumes the armed retry, so it counts against the budget
        if (reconnect_timer_ != timer::INVALID_TIMER) {
            cancel_reconnect_();
            ++attempts_;
        }
        state_ = ConnectionState::Connecting;
        emit_(cloud::Signal::Connecting);
        TS_DEBUG("[CLOUD] Connecting to " << url_ << " (attempt " << attempts_ << ")");

        ws_ = std::make_unique<WS>(telemetry_.websocket);
        last_error_ = ws_->connect(parsed_url_);
        if (last_error_ != Error::None) {
            TS_WARN("[CLOUD] Connect attempt failed to start (" << to_string(last_error_) << ")");
            emit_(cloud::Signal::TransportError);
            on_transport_closed_();
            return last_error_;
        }
        return Error::None;
    }

    // Clean local shutdown. Cancels reconnect and heartbeat. No signals.
    inline void close() noexcept {
        cancel_reconnect_();
        cancel_heartbeat_();
        if (ws_) {
            TS_DEBUG("[CLOUD] Closing connection (client shutdown)");
            ws_->close();
            ws_.reset();
        }
        state_ = ConnectionState::Disconnected;
        attempts_ = 0;
    }

    // -------------------------------------------------------------------------
    // Sending
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline bool send(std::string_view text) noexcept {
        TS_TL1( telemetry_.send_calls_total.inc() );
        if (state_ != ConnectionState::Connected || !ws_) {
            TS_TRACE("[CLOUD] send() rejected (state: " << to_string(state_) << ")");
            TS_TL1( telemetry_.send_rejected_total.inc() );
            return false;
        }
        if (!ws_->send(text)) {
            TS_TL1( telemetry_.send_rejected_total.inc() );
            return false;
        }
        ++tx_messages_;
        return true;
    }

    // -------------------------------------------------------------------------
    // Event loop
    // -------------------------------------------------------------------------

    // Drains transport events. Timers are fired by the owner's Scheduler.
    inline void poll() noexcept {
        websocket::Event ev;
        while (ws_ && ws_->poll_event(ev)) {
            switch (ev.type) {
                case websocket::EventType::Open:
                    on_transport_open_();
                    break;
                case websocket::EventType::Message:
                    on_transport_message_(ev.data);
                    break;
                case websocket::EventType::Error:
                    on_transport_error_(ev.error);
                    break;
                case websocket::EventType::Close:
                    on_transport_closed_();
                    break;
            }
        }
    }

    [[nodiscard]]
    inline bool poll_signal(cloud::Signal& out) noexcept {
        return signals_.pop(out);
    }

    // Heartbeat reply observed by the router
    inline void on_pong() noexcept {
        TS_TL1( telemetry_.pongs_received_total.inc() );
        ++pongs_received_;
        last_pong_ = scheduler_.clock().now();
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] inline ConnectionState state() const noexcept { return state_; }
    [[nodiscard]] inline bool is_open() const noexcept { return state_ == ConnectionState::Connected; }
    [[nodiscard]] inline std::uint32_t reconnect_attempts() const noexcept { return attempts_; }
    [[nodiscard]] inline bool reconnect_pending() const noexcept { return reconnect_timer_ != timer::INVALID_TIMER; }
    [[nodiscard]] inline std::chrono::milliseconds last_retry_delay() const noexcept { return last_retry_delay_; }
    [[nodiscard]] inline std::uint64_t epoch() const noexcept { return epoch_; }
    [[nodiscard]] inline std::uint64_t rx_messages() const noexcept { return rx_messages_; }
    [[nodiscard]] inline std::uint64_t tx_messages() const noexcept { return tx_messages_; }
    [[nodiscard]] inline std::uint64_t pongs_received() const noexcept { return pongs_received_; }
    [[nodiscard]] inline timer::TimePoint last_pong() const noexcept { return last_pong_; }
    [[nodiscard]] inline Error last_error() const noexcept { return last_error_; }
    [[nodiscard]] inline const ReconnectPolicy& policy() const noexcept { return policy_; }

    // -------------------------------------------------------------------------
    // Mutators
    // -------------------------------------------------------------------------

    inline void set_message_handler(MessageHandler handler) {
        on_message_ = std::move(handler);
    }

    // Replaces the default uniform [0, jitter_max) source
    inline void set_jitter_source(JitterSource source) {
        jitter_ = std::move(source);
    }

#ifdef TS_UNIT_TEST
public:
    WS* ws() noexcept {
        return ws_.get();
    }
#endif // TS_UNIT_TEST

private:
    timer::Scheduler<Clock>& scheduler_;
    telemetry::Cloud& telemetry_;
    ReconnectPolicy policy_;
    std::chrono::milliseconds heartbeat_interval_;

    // Endpoint
    bool has_endpoint_ = false;
    std::string url_;
    ParsedUrl parsed_url_;

    // Transport
    std::unique_ptr<WS> ws_;
    ConnectionState state_ = ConnectionState::Disconnected;
    Error last_error_ = Error::None;

    // Reconnect
    std::uint32_t attempts_ = 0;
    timer::TimerId reconnect_timer_ = timer::INVALID_TIMER;
    std::chrono::milliseconds last_retry_delay_{0};
    JitterSource jitter_;
    std::mt19937 rng_;

    // Heartbeat
    timer::TimerId heartbeat_timer_ = timer::INVALID_TIMER;
    std::uint64_t pongs_received_ = 0;
    timer::TimePoint last_pong_{};

    // Progress
    std::uint64_t epoch_ = 0;
    std::uint64_t rx_messages_ = 0;
    std::uint64_t tx_messages_ = 0;

    MessageHandler on_message_;
    lcr::lockfree::spsc_ring<cloud::Signal, 64> signals_;

private:
    inline void emit_(cloud::Signal sig) noexcept {
        if (!signals_.push(sig)) {
            TS_TL1( telemetry_.signals_dropped_total.inc() );
            TS_WARN("[CLOUD] Signal ring full, dropping " << cloud::to_string(sig));
        }
    }

    inline void on_transport_open_() noexcept {
        if (state_ != ConnectionState::Connecting) {
            TS_WARN("[CLOUD] Unexpected open event (state: " << to_string(state_) << ")");
            return;
        }
        TS_TL1( telemetry_.connect_success_total.inc() );
        state_ = ConnectionState::Connected;
        attempts_ = 0;
        ++epoch_;
        last_error_ = Error::None;
        TS_INFO("[CLOUD] Connected to " << url_);
        arm_heartbeat_();
        emit_(cloud::Signal::Connected);
    }

    inline void on_transport_message_(std::string_view text) noexcept {
        ++rx_messages_;
        if (on_message_) {
            on_message_(text);
        }
    }

    inline void on_transport_error_(Error err) noexcept {
        last_error_ = err;
        TS_WARN("[CLOUD] Transport error: " << to_string(err));
        emit_(cloud::Signal::TransportError);
    }

    inline void on_transport_closed_() noexcept {
        TS_TL1( telemetry_.disconnect_events_total.inc() );
        cancel_heartbeat_();
        ws_.reset();
        state_ = ConnectionState::Disconnected;
        TS_INFO("[CLOUD] Disconnected");
        emit_(cloud::Signal::Disconnected);
        schedule_reconnect_();
    }

    inline void schedule_reconnect_() noexcept {
        if (attempts_ >= policy_.max_attempts) {
            TS_WARN("[CLOUD] Max reconnect attempts (" << policy_.max_attempts << ") reached, giving up");
            TS_TL1( telemetry_.retry_exhausted_total.inc() );
            emit_(cloud::Signal::RetriesExhausted);
            return;
        }
        last_retry_delay_ = backoff_delay(policy_, attempts_, next_jitter_());
        TS_DEBUG("[CLOUD] Reconnecting in " << last_retry_delay_.count() << " ms (attempt " << (attempts_ + 1) << ")");
        reconnect_timer_ = scheduler_.schedule_after(last_retry_delay_, [this]() {
            reconnect_timer_ = timer::INVALID_TIMER;
            ++attempts_;
            (void)connect(); // failures re-enter schedule_reconnect_()
        });
        TS_TL1( telemetry_.retry_scheduled_total.inc() );
        emit_(cloud::Signal::RetryScheduled);
    }

    inline void cancel_reconnect_() noexcept {
        if (reconnect_timer_ != timer::INVALID_TIMER) {
            scheduler_.cancel(reconnect_timer_);
            reconnect_timer_ = timer::INVALID_TIMER;
        }
    }

    inline void arm_heartbeat_() noexcept {
        if (heartbeat_interval_ <= std::chrono::milliseconds::zero()) {
            return;
        }
        heartbeat_timer_ = scheduler_.schedule_after(heartbeat_interval_, [this]() {
            heartbeat_timer_ = timer::INVALID_TIMER;
            if (state_ != ConnectionState::Connected) {
                return;
            }
            if (send(R"({"type":"ping"})")) {
                TS_TL1( telemetry_.pings_sent_total.inc() );
                TS_TRACE("[CLOUD] Heartbeat ping sent");
            }
            arm_heartbeat_();
        });
    }

    inline void cancel_heartbeat_() noexcept {
        if (heartbeat_timer_ != timer::INVALID_TIMER) {
            scheduler_.cancel(heartbeat_timer_);
            heartbeat_timer_ = timer::INVALID_TIMER;
        }
    }

    inline std::chrono::milliseconds next_jitter_() noexcept {
        if (jitter_) {
            return jitter_();
        }
        const auto span = policy_.jitter_max.count();
        if (span <= 0) {
            return std::chrono::milliseconds::zero();
        }
        std::uniform_int_distribution<std::int64_t> dist(0, span - 1);
        return std::chrono::milliseconds{dist(rng_)};
    }
};

} // namespace tablesync::core::transport
