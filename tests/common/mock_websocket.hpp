#pragma once

#include <deque>
#include <string>
#include <string_view>
#include <vector>

#include "tablesync/core/transport/websocket_concept.hpp"
#include "tablesync/core/transport/websocket/events.hpp"
#include "tablesync/core/transport/telemetry/websocket.hpp"
#include "lcr/log/logger.hpp"


namespace tablesync::core::transport::test {

/*
===============================================================================
 MockWebSocket
===============================================================================

Scripted transport for CloudChannel tests.

- connect() records the URL and returns connect_result (None by default);
  with auto_open set, an Open event is queued immediately
- Tests inject events on the live instance through the static emit_*()
  helpers; they are delivered on the next poll_event()
- Sent frames are kept in a static log so they survive the instance
  (CloudChannel destroys the transport on every close)

Counters and the log are static: call reset() at the start of each test.
===============================================================================
*/
class MockWebSocket {
public:
    explicit MockWebSocket(telemetry::WebSocket&) {
        TS_TRACE("[MockWebSocket] constructed");
        current_ = this;
        ++instances_;
    }

    ~MockWebSocket() {
        TS_TRACE("[MockWebSocket] destructed");
        if (current_ == this) {
            current_ = nullptr;
        }
    }

    MockWebSocket(const MockWebSocket&) = delete;
    MockWebSocket& operator=(const MockWebSocket&) = delete;

    // ---------------------------------------------------------------------
    // WebSocketConcept API
    // ---------------------------------------------------------------------

    inline Error connect(const ParsedUrl& url) noexcept {
        ++connect_calls_;
        last_url_ = to_string(url);
        if (connect_result_ != Error::None) {
            return connect_result_;
        }
        if (auto_open_) {
            events_.push_back(websocket::Event::make_open());
        }
        return Error::None;
    }

    inline void close() noexcept {
        ++close_calls_;
        open_ = false;
    }

    inline bool send(std::string_view text) noexcept {
        if (!open_) {
            return false;
        }
        sent_.emplace_back(text);
        return true;
    }

    inline bool poll_event(websocket::Event& out) noexcept {
        if (events_.empty()) {
            return false;
        }
        out = std::move(events_.front());
        events_.pop_front();
        if (out.type == websocket::EventType::Open) {
            open_ = true;
        } else if (out.type == websocket::EventType::Close) {
            open_ = false;
        }
        return true;
    }

    // ---------------------------------------------------------------------
    // Test helpers (act on the live instance)
    // ---------------------------------------------------------------------

    static inline bool emit_open() {
        return push_(websocket::Event::make_open());
    }

    static inline bool emit_message(std::string text) {
        return push_(websocket::Event::make_message(std::move(text)));
    }

    static inline bool emit_error(Error err = Error::TransportFailure) {
        return push_(websocket::Event::make_error(err));
    }

    static inline bool emit_close() {
        return push_(websocket::Event::make_close());
    }

    // Error then Close, as a real transport reports a dropped link
    static inline bool emit_drop(Error err = Error::RemoteClosed) {
        return emit_error(err) && emit_close();
    }

    // ---------------------------------------------------------------------
    // Accessors
    // ---------------------------------------------------------------------

    [[nodiscard]] static inline MockWebSocket* current() noexcept { return current_; }
    [[nodiscard]] static inline int connect_calls() noexcept { return connect_calls_; }
    [[nodiscard]] static inline int close_calls() noexcept { return close_calls_; }
    [[nodiscard]] static inline int instances() noexcept { return instances_; }
    [[nodiscard]] static inline const std::string& last_url() noexcept { return last_url_; }
    [[nodiscard]] static inline const std::vector<std::string>& sent() noexcept { return sent_; }

    // Frames whose text contains `needle`
    [[nodiscard]]
    static inline std::size_t sent_count(std::string_view needle) {
        std::size_t n = 0;
        for (const auto& frame : sent_) {
            if (frame.find(needle) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

    // ---------------------------------------------------------------------
    // Mutators
    // ---------------------------------------------------------------------

    static inline void set_auto_open(bool on) noexcept { auto_open_ = on; }
    static inline void set_connect_result(Error err) noexcept { connect_result_ = err; }
    static inline void clear_sent() { sent_.clear(); }

    static inline void reset() {
        current_ = nullptr;
        connect_calls_ = 0;
        close_calls_ = 0;
        instances_ = 0;
        auto_open_ = false;
        connect_result_ = Error::None;
        last_url_.clear();
        sent_.clear();
    }

private:
    std::deque<websocket::Event> events_;
    bool open_ = false;

    static inline MockWebSocket* current_ = nullptr;
    static inline int connect_calls_ = 0;
    static inline int close_calls_ = 0;
    static inline int instances_ = 0;
    static inline bool auto_open_ = false;
    static inline Error connect_result_ = Error::None;
    static inline std::string last_url_;
    static inline std::vector<std::string> sent_;

private:
    static inline bool push_(websocket::Event ev) {
        if (!current_) {
            return false;
        }
        current_->events_.push_back(std::move(ev));
        return true;
    }
};

// Assert that MockWebSocket conforms to transport::WebSocketConcept concept
static_assert(WebSocketConcept<MockWebSocket>);

} // namespace tablesync::core::transport::test
