#pragma once

/*
===============================================================================
 tablesync::core::transport::beast::WebSocket
===============================================================================

Boost.Beast WebSocket client (ws:// and wss://) conforming to
transport::WebSocketConcept.

Threading
---------
- connect() starts one I/O thread running a private io_context
- resolve → TCP connect → (TLS handshake) → WebSocket upgrade → read loop
  all run on that thread as an async callback chain
- Open / Message / Error / Close are pushed into an SPSC ring; the owner
  drains them with poll_event() on its poll thread
- send() copies the frame and posts it to the I/O thread (write queue)

Close semantics
---------------
- Close is emitted exactly once per instance that started connect()
- Local close() performs a normal WebSocket close (1000) and waits up to
  CLOSE_TIMEOUT for the I/O thread, then stops it forcibly

TLS
---
- Peer verification against the system trust store, SNI and host name
  verification enabled
===============================================================================
*/

#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "tablesync/core/transport/websocket_concept.hpp"
#include "tablesync/core/transport/telemetry/websocket.hpp"
#include "tablesync/core/transport/parse_url.hpp"
#include "tablesync/core/transport/websocket/events.hpp"
#include "tablesync/core/telemetry.hpp"
#include "lcr/lockfree/spsc_ring.hpp"
#include "lcr/log/logger.hpp"


namespace tablesync::core::transport::beast {

namespace net       = boost::asio;
namespace ssl       = boost::asio::ssl;
namespace bbeast    = boost::beast;
namespace beast_ws  = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(30);
constexpr auto CLOSE_TIMEOUT   = std::chrono::milliseconds(1000);
inline constexpr const char* USER_AGENT = "TableSync/1.0";

class WebSocket {
    using PlainStream = beast_ws::stream<bbeast::tcp_stream>;
    using TlsStream   = beast_ws::stream<bbeast::ssl_stream<bbeast::tcp_stream>>;

    enum class Stage : std::uint8_t { Resolve, Connect, TlsHandshake, Upgrade, Read, Write, Close };

public:
    explicit WebSocket(telemetry::WebSocket& telemetry)
        : telemetry_(telemetry)
        , ssl_ctx_(ssl::context::tls_client)
        , resolver_(ioc_)
    {
        TS_TRACE("[WS] constructed");
    }

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    ~WebSocket() {
        close();
        TS_TRACE("[WS] destroyed");
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Error connect(const ParsedUrl& url) noexcept {
        if (started_) {
            TS_WARN("[WS] connect() called twice on the same transport");
            return Error::InvalidState;
        }
        TS_TL1( telemetry_.connect_attempts_total.inc() );
        url_ = url;
        try {
            if (url_.secure) {
                boost::system::error_code ec;
                ssl_ctx_.set_default_verify_paths(ec);
                if (ec) {
                    TS_WARN("[WS] Could not load system trust store: " << ec.message());
                }
                ssl_ctx_.set_verify_mode(ssl::verify_peer);
                tls_ws_ = std::make_unique<TlsStream>(ioc_, ssl_ctx_);
            } else {
                plain_ws_ = std::make_unique<PlainStream>(ioc_);
            }
            resolver_.async_resolve(url_.host, url_.port,
                [this](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                    on_resolve_(ec, std::move(results));
                });
            started_ = true;
            io_thread_ = std::thread([this]() { run_(); });
        } catch (const std::exception& e) {
            TS_ERROR("[WS] Failed to start connection to " << url_.host << ": " << e.what());
            started_ = false;
            return Error::TransportFailure;
        }
        return Error::None;
    }

    inline void close() noexcept {
        if (!started_ || joined_) {
            return;
        }
        closing_.store(true, std::memory_order_release);
        net::post(ioc_, [this]() { begin_close_(); });

        const auto deadline = std::chrono::steady_clock::now() + CLOSE_TIMEOUT;
        while (!io_done_.load(std::memory_order_acquire) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (!io_done_.load(std::memory_order_acquire)) {
            TS_DEBUG("[WS] Close handshake timed out, stopping I/O");
            ioc_.stop();
        }
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
        joined_ = true;
        // I/O thread is gone; this thread is now the only producer.
        signal_close_();
    }

    // -------------------------------------------------------------------------
    // Sending
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline bool send(std::string_view text) noexcept {
        if (!opened_.load(std::memory_order_acquire) || closing_.load(std::memory_order_acquire)) {
            return false;
        }
        try {
            net::post(ioc_, [this, msg = std::string(text)]() mutable {
                write_queue_.push_back(std::move(msg));
                if (!writing_) {
                    do_write_();
                }
            });
        } catch (const std::exception& e) {
            TS_ERROR("[WS] send() failed: " << e.what());
            return false;
        }
        return true;
    }

    // -------------------------------------------------------------------------
    // Event draining (poll thread)
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline bool poll_event(websocket::Event& out) noexcept {
        return events_.pop(out);
    }

private:
    telemetry::WebSocket& telemetry_;
    ParsedUrl url_;

    net::io_context ioc_;
    ssl::context ssl_ctx_;
    tcp::resolver resolver_;
    std::unique_ptr<PlainStream> plain_ws_;
    std::unique_ptr<TlsStream> tls_ws_;
    bbeast::flat_buffer read_buffer_;
    std::deque<std::string> write_queue_; // I/O thread only
    bool writing_ = false;                // I/O thread only

    std::thread io_thread_;
    bool started_ = false;
    bool joined_ = false;
    std::atomic<bool> opened_{false};
    std::atomic<bool> closing_{false};
    std::atomic<bool> io_done_{false};
    std::atomic<bool> close_signaled_{false};

    lcr::lockfree::spsc_ring<websocket::Event, 1024> events_;

private:
    template <typename F>
    inline void with_stream_(F&& f) {
        if (tls_ws_) {
            f(*tls_ws_);
        } else if (plain_ws_) {
            f(*plain_ws_);
        }
    }

    inline void run_() noexcept {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            TS_ERROR("[WS] I/O thread terminated: " << e.what());
            push_(websocket::Event::make_error(Error::TransportFailure));
            signal_close_();
        }
        io_done_.store(true, std::memory_order_release);
    }

    // --- async chain ----------------------------------------------------------

    inline void on_resolve_(const boost::system::error_code& ec, tcp::resolver::results_type results) {
        if (ec) {
            return fail_(Stage::Resolve, ec);
        }
        with_stream_([&](auto& ws) {
            auto& tcp_stream = bbeast::get_lowest_layer(ws);
            tcp_stream.expires_after(CONNECT_TIMEOUT);
            tcp_stream.async_connect(results,
                [this](const boost::system::error_code& ec, const tcp::endpoint&) { on_connect_(ec); });
        });
    }

    inline void on_connect_(const boost::system::error_code& ec) {
        if (ec) {
            return fail_(Stage::Connect, ec);
        }
        if (!tls_ws_) {
            return start_upgrade_();
        }
        auto& tls = tls_ws_->next_layer();
        if (!SSL_set_tlsext_host_name(tls.native_handle(), url_.host.c_str())) {
            const boost::system::error_code sni_ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            return fail_(Stage::TlsHandshake, sni_ec);
        }
        tls.set_verify_callback(ssl::host_name_verification(url_.host));
        bbeast::get_lowest_layer(*tls_ws_).expires_after(CONNECT_TIMEOUT);
        tls.async_handshake(ssl::stream_base::client,
            [this](const boost::system::error_code& ec) {
                if (ec) {
                    return fail_(Stage::TlsHandshake, ec);
                }
                start_upgrade_();
            });
    }

    inline void start_upgrade_() {
        with_stream_([&](auto& ws) {
            // WebSocket has its own timeouts from here on
            bbeast::get_lowest_layer(ws).expires_never();
            ws.set_option(beast_ws::stream_base::timeout::suggested(bbeast::role_type::client));
            ws.set_option(beast_ws::stream_base::decorator(
                [](beast_ws::request_type& req) {
                    req.set(bbeast::http::field::user_agent, USER_AGENT);
                }));
            ws.text(true);
            ws.async_handshake(url_.host, url_.path,
                [this](const boost::system::error_code& ec) { on_upgrade_(ec); });
        });
    }

    inline void on_upgrade_(const boost::system::error_code& ec) {
        if (ec) {
            return fail_(Stage::Upgrade, ec);
        }
        if (closing_.load(std::memory_order_acquire)) {
            return begin_close_();
        }
        opened_.store(true, std::memory_order_release);
        TS_DEBUG("[WS] Upgrade complete: " << url_.host << url_.path);
        push_(websocket::Event::make_open());
        do_read_();
    }

    inline void do_read_() {
        with_stream_([&](auto& ws) {
            ws.async_read(read_buffer_,
                [this](const boost::system::error_code& ec, std::size_t bytes) { on_read_(ec, bytes); });
        });
    }

    inline void on_read_(const boost::system::error_code& ec, std::size_t bytes) {
        if (ec) {
            return fail_(Stage::Read, ec);
        }
        TS_TL1( telemetry_.bytes_rx_total.inc(bytes) );
        TS_TL1( telemetry_.messages_rx_total.inc() );
        std::string text = bbeast::buffers_to_string(read_buffer_.data());
        read_buffer_.consume(read_buffer_.size());
        if (!events_.push(websocket::Event::make_message(std::move(text)))) {
            TS_TL1( telemetry_.messages_dropped_total.inc() );
            TS_WARN("[WS] Event ring full, dropping inbound frame");
        }
        do_read_();
    }

    inline void do_write_() {
        if (write_queue_.empty() || closing_.load(std::memory_order_acquire)) {
            writing_ = false;
            return;
        }
        writing_ = true;
        with_stream_([&](auto& ws) {
            ws.async_write(net::buffer(write_queue_.front()),
                [this](const boost::system::error_code& ec, std::size_t bytes) {
                    if (ec) {
                        writing_ = false;
                        return fail_(Stage::Write, ec);
                    }
                    TS_TL1( telemetry_.bytes_tx_total.inc(bytes) );
                    TS_TL1( telemetry_.messages_tx_total.inc() );
                    write_queue_.pop_front();
                    do_write_();
                });
        });
    }

    // Runs on the I/O thread after close() posted it.
    inline void begin_close_() {
        resolver_.cancel();
        if (!opened_.load(std::memory_order_acquire)) {
            with_stream_([](auto& ws) {
                boost::system::error_code ignored;
                bbeast::get_lowest_layer(ws).socket().close(ignored);
            });
            return;
        }
        opened_.store(false, std::memory_order_release);
        with_stream_([&](auto& ws) {
            ws.async_close(beast_ws::close_code::normal,
                [this](const boost::system::error_code& ec) {
                    if (ec && ec != net::error::operation_aborted) {
                        TS_DEBUG("[WS] Close handshake error: " << ec.message());
                    }
                    with_stream_([](auto& s) {
                        boost::system::error_code ignored;
                        bbeast::get_lowest_layer(s).socket().close(ignored);
                    });
                });
        });
    }

    inline void fail_(Stage stage, const boost::system::error_code& ec) {
        opened_.store(false, std::memory_order_release);
        if (closing_.load(std::memory_order_acquire)) {
            // Local shutdown in progress; aborted operations are expected.
            return;
        }
        const Error err = classify_(stage, ec);
        TS_TL1( telemetry_.receive_errors_total.inc() );
        if (err == Error::RemoteClosed) {
            TS_INFO("[WS] Connection closed by peer (" << ec.message() << ")");
        } else {
            TS_WARN("[WS] " << stage_name_(stage) << " failed: " << ec.message() << " (" << to_string(err) << ")");
            push_(websocket::Event::make_error(err));
        }
        with_stream_([](auto& ws) {
            boost::system::error_code ignored;
            bbeast::get_lowest_layer(ws).socket().close(ignored);
        });
        signal_close_();
    }

    [[nodiscard]]
    static inline Error classify_(Stage stage, const boost::system::error_code& ec) noexcept {
        if (ec == beast_ws::error::closed || ec == net::error::eof || ec == net::error::connection_reset) {
            return Error::RemoteClosed;
        }
        if (ec == bbeast::error::timeout || ec == net::error::timed_out) {
            return Error::Timeout;
        }
        if (ec == net::error::operation_aborted) {
            return Error::Cancelled;
        }
        switch (stage) {
            case Stage::Resolve:
            case Stage::Connect:      return Error::ConnectionFailed;
            case Stage::TlsHandshake:
            case Stage::Upgrade:      return Error::HandshakeFailed;
            case Stage::Read:
            case Stage::Write:        return Error::ProtocolError;
            default:                  return Error::TransportFailure;
        }
    }

    [[nodiscard]]
    static inline const char* stage_name_(Stage stage) noexcept {
        switch (stage) {
            case Stage::Resolve:      return "Resolve";
            case Stage::Connect:      return "TCP connect";
            case Stage::TlsHandshake: return "TLS handshake";
            case Stage::Upgrade:      return "WebSocket upgrade";
            case Stage::Read:         return "Read";
            case Stage::Write:        return "Write";
            case Stage::Close:        return "Close";
            default:                  return "?";
        }
    }

    inline void push_(websocket::Event&& ev) noexcept {
        if (!events_.push(std::move(ev))) {
            TS_ERROR("[WS] Event ring full, control event lost");
        }
    }

    inline void signal_close_() noexcept {
        bool expected = false;
        if (!close_signaled_.compare_exchange_strong(expected, true)) {
            return;
        }
        TS_TL1( telemetry_.close_events_total.inc() );
        push_(websocket::Event::make_close());
    }
};

static_assert(transport::WebSocketConcept<WebSocket>);

} // namespace tablesync::core::transport::beast
