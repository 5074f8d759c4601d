#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "dashwire/core/clock.hpp"
#include "dashwire/core/listeners.hpp"
#include "dashwire/protocol/codec.hpp"
#include "dashwire/protocol/frame.hpp"
#include "dashwire/router/router.hpp"
#include "dashwire/subscription/registry.hpp"
#include "dashwire/transport/config.hpp"
#include "dashwire/transport/error.hpp"
#include "dashwire/transport/parse_url.hpp"
#include "dashwire/transport/state.hpp"
#include "dashwire/transport/telemetry.hpp"
#include "dashwire/transport/websocket/events.hpp"
#include "dashwire/transport/websocket_concept.hpp"
#include "dashwire/log/logger.hpp"


namespace dashwire::transport {

/*
===============================================================================
 dashwire::transport::Connection
===============================================================================

Logical dashboard connection, parameterized by a socket implementation
conforming to transport::WebSocketConcept and a clock conforming to
ClockConcept.

A Connection keeps its identity across transient socket failures: it owns at
most one socket at a time and replaces it on every reconnect attempt.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Open and close the socket (connect / disconnect)
- Reconnect with exponential backoff after unexpected closes
- Detect dead peers with an application-level ping/pong heartbeat
- Keep the subscription registry and replay it after every open
- Decode inbound frames and hand them to the Router

-------------------------------------------------------------------------------
 State machine
-------------------------------------------------------------------------------

    Disconnected ──connect()──► Connecting ──open──► Connected
         ▲                          │                    │
         │                    fail (1st attempt)     close (code ∉ {1000,1001})
         │                          ▼                    ▼
         │                        Error ◄──exhausted── Reconnecting
         │                                              │   ▲
         └────────── disconnect() / close 1000,1001     └───┘ retry timer

- First-attempt failures are reported to the caller of connect() and leave
  the connection in Error. Failures inside a reconnect cycle feed back into
  the retry policy and are never reported as errors.
- delay(n) = min(reconnect_delay * 2^(n-1), 30000 ms)
- Every heartbeat_interval: if no pong was seen for more than two intervals
  the socket is force-closed with code 4000 (which reconnects), otherwise a
  ping is sent.
- disconnect() is the only cancellation point: it cancels the heartbeat and
  any pending retry.

-------------------------------------------------------------------------------
 Threading model
-------------------------------------------------------------------------------
- Single-threaded, poll-driven. No timers, no background threads.
- connect() blocks until the socket opens or fails.
- poll() drives socket I/O, dispatches handlers and evaluates deadlines.
- Handlers may call back into the Connection (send, subscribe, disconnect...).
  Sockets closed from inside their own callbacks are retired and destroyed at
  the next safe point.
===============================================================================
*/

template<WebSocketConcept WS, ClockConcept Clock = SystemClock>
class Connection {
public:
    using StatusListener = std::function<void(State)>;

    explicit Connection(Config cfg = {})
        : cfg_(std::move(cfg))
        , status_listeners_(std::make_shared<core::ListenerSet<State>>())
    {}

    ~Connection() {
        if (ws_) {
            ws_->close(close_code::Normal);
        }
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Opens the socket. Blocks until open or failed.
    // A no-op when already connected.
    [[nodiscard]]
    inline Error connect() {
        telemetry_.connect_calls_total.inc();
        if (state_ == State::Connected) {
            DW_DEBUG("[CONN] connect() called while already connected. Ignoring.");
            return Error::None;
        }
        if (state_ == State::Reconnecting) {
            // Skip the remaining backoff, stay in the current retry cycle
            retry_armed_ = false;
        }
        else {
            attempts_ = 0;
        }
        DW_DEBUG("[CONN] Connecting to: " << cfg_.url);
        return attempt_();
    }

    // Closes the socket with `code` and cancels heartbeat and retry timers
    inline void disconnect(std::uint16_t code = close_code::Normal) {
        telemetry_.disconnect_calls_total.inc();
        heartbeat_armed_ = false;
        retry_armed_ = false;
        attempts_ = 0;
        if (ws_) {
            ws_->close(code);
            retire_transport_();
        }
        if (state_ != State::Disconnected) {
            DW_INFO("[CONN] Disconnected from server: " << cfg_.url << " (code=" << code << ")");
            set_state_(State::Disconnected);
        }
    }

    // Drives socket I/O, handler dispatch and deadlines
    inline void poll() {
        retired_.clear();

        drain_events_();

        const std::int64_t now = Clock::now_ms();

        if (state_ == State::Reconnecting && retry_armed_ && now >= next_retry_at_) {
            retry_armed_ = false;
            telemetry_.retry_attempts_total.inc();
            DW_INFO("[CONN] Reconnect attempt " << attempts_ << "/" << cfg_.max_reconnect_attempts);
            (void)attempt_();
        }

        if (state_ == State::Connected && heartbeat_armed_ && now >= next_heartbeat_at_) {
            heartbeat_(now);
        }

        retired_.clear();
    }

    // -------------------------------------------------------------------------
    // Sending
    // -------------------------------------------------------------------------

    // Returns false if the socket is not open
    [[nodiscard]]
    inline bool send(const protocol::RawFrame& frame) {
        return send_text(protocol::to_json(frame));
    }

    [[nodiscard]]
    inline bool send_text(const std::string& text) {
        telemetry_.send_calls_total.inc();
        if (state_ != State::Connected || !ws_) {
            DW_WARN("[CONN] send() called while not connected (state: " << to_string(state_) << "). Ignoring.");
            telemetry_.send_rejected_total.inc();
            return false;
        }
        return send_raw_(text);
    }

    // -------------------------------------------------------------------------
    // Subscriptions
    // -------------------------------------------------------------------------

    // Registers the channel; sends the subscribe frame now if connected,
    // otherwise on the next open.
    inline bool subscribe(const std::string& channel) {
        if (channel.empty()) {
            DW_WARN("[CONN] subscribe() called with an empty channel name. Ignoring.");
            return false;
        }
        registry_.add(channel);
        if (state_ != State::Connected) {
            DW_DEBUG("[CONN] Subscription to {" << channel << "} deferred until connected");
            return true;
        }
        return send(protocol::make_subscribe(channel));
    }

    // Unregisters the channel and drops its channel handlers
    inline bool unsubscribe(const std::string& channel) {
        if (channel.empty()) {
            DW_WARN("[CONN] unsubscribe() called with an empty channel name. Ignoring.");
            return false;
        }
        registry_.remove(channel);
        router_.remove_channel(channel);
        if (state_ != State::Connected) {
            return true;
        }
        return send(protocol::make_unsubscribe(channel));
    }

    // -------------------------------------------------------------------------
    // Handlers
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline Unsubscribe on(std::string_view type, router::Router::Handler handler) {
        return router_.on(type, std::move(handler));
    }

    [[nodiscard]]
    inline Unsubscribe on_channel(std::string_view channel, router::Router::Handler handler) {
        return router_.on_channel(channel, std::move(handler));
    }

    [[nodiscard]]
    inline Unsubscribe on_all(router::Router::Handler handler) {
        return router_.on_all(std::move(handler));
    }

    inline void clear_handlers() noexcept {
        router_.clear();
    }

    [[nodiscard]]
    inline Unsubscribe on_status_change(StatusListener listener) {
        const std::uint64_t id = status_listeners_->add(std::move(listener));
        std::weak_ptr<core::ListenerSet<State>> weak = status_listeners_;
        return [weak, id]() {
            if (auto set = weak.lock()) {
                set->remove(id);
            }
        };
    }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] inline State state() const noexcept { return state_; }
    [[nodiscard]] inline bool is_connected() const noexcept { return state_ == State::Connected; }
    [[nodiscard]] inline Error last_error() const noexcept { return last_error_; }

    [[nodiscard]] inline int reconnect_attempts() const noexcept { return attempts_; }
    [[nodiscard]] inline bool retry_pending() const noexcept { return retry_armed_; }
    [[nodiscard]] inline std::int64_t next_retry_at() const noexcept { return next_retry_at_; }

    [[nodiscard]] inline bool heartbeat_active() const noexcept { return heartbeat_armed_; }
    [[nodiscard]] inline std::int64_t next_heartbeat_at() const noexcept { return next_heartbeat_at_; }
    [[nodiscard]] inline std::int64_t last_pong_at() const noexcept { return last_pong_at_; }

    [[nodiscard]] inline const subscription::Registry& subscriptions() const noexcept { return registry_; }
    [[nodiscard]] inline router::Router& router() noexcept { return router_; }
    [[nodiscard]] inline const Config& config() const noexcept { return cfg_; }
    [[nodiscard]] inline const telemetry::Connection& telemetry() const noexcept { return telemetry_; }

#ifdef DW_UNIT_TEST
public:
    [[nodiscard]] inline bool has_ws() const noexcept { return static_cast<bool>(ws_); }
    [[nodiscard]] inline WS& ws() noexcept { return *ws_; }

    inline void force_last_pong(std::int64_t ms) noexcept { last_pong_at_ = ms; }
#endif // DW_UNIT_TEST

private:
    // One connection attempt, first or retry
    inline Error attempt_() {
        ParsedUrl url;
        if (auto err = parse_url(cfg_.url, url); err != Error::None) {
            DW_ERROR("[CONN] URL parsing failed: " << cfg_.url);
            last_error_ = err;
            telemetry_.connect_failure_total.inc();
            set_state_(State::Error);
            return err;
        }
        if (url.secure && !WS::supports_tls) {
            DW_ERROR("[CONN] wss:// is not supported by this transport: " << cfg_.url);
            last_error_ = Error::InvalidUrl;
            telemetry_.connect_failure_total.inc();
            set_state_(State::Error);
            return Error::InvalidUrl;
        }

        set_state_(State::Connecting);
        if (state_ != State::Connecting) {
            // A status listener either connected re-entrantly or cancelled the attempt
            return state_ == State::Connected ? Error::None : Error::InvalidState;
        }
        create_transport_();

        const Error err = ws_->connect(url.host, url.port, url.path);
        if (err != Error::None) {
            telemetry_.connect_failure_total.inc();
            last_error_ = err;
            retire_transport_();
            if (attempts_ == 0) {
                DW_ERROR("[CONN] Connection failed (" << to_string(err) << ")");
                set_state_(State::Error);
                return err;
            }
            DW_WARN("[CONN] Reconnect attempt failed (" << to_string(err) << ")");
            schedule_reconnect_();
            return err;
        }

        on_open_();
        return Error::None;
    }

    inline void on_open_() {
        attempts_ = 0;
        retry_armed_ = false;
        last_error_ = Error::None;
        telemetry_.connect_success_total.inc();

        const std::int64_t now = Clock::now_ms();
        last_pong_at_ = now;
        heartbeat_armed_ = cfg_.heartbeat_interval > 0;
        next_heartbeat_at_ = now + cfg_.heartbeat_interval;

        // Subscriptions are on the wire before listeners observe Connected
        registry_.for_each([this](const std::string& channel) {
            DW_DEBUG("[CONN] Resubscribing to {" << channel << "}");
            (void)send_raw_(protocol::to_json(protocol::make_subscribe(channel)));
        });

        DW_INFO("[CONN] Connected to server: " << cfg_.url);
        set_state_(State::Connected);
    }

    inline void on_closed_(std::uint16_t code) {
        heartbeat_armed_ = false;
        retire_transport_();

        if (close_code::is_intentional(code)) {
            DW_INFO("[CONN] Connection closed (code=" << code << ")");
            set_state_(State::Disconnected);
            return;
        }

        telemetry_.unexpected_close_total.inc();
        if (code != close_code::HeartbeatTimeout && last_error_ == Error::None) {
            last_error_ = Error::RemoteClosed;
        }
        DW_WARN("[CONN] Connection lost (code=" << code << ")");
        schedule_reconnect_();
    }

    inline void schedule_reconnect_() {
        if (attempts_ >= cfg_.max_reconnect_attempts) {
            telemetry_.retry_exhausted_total.inc();
            last_error_ = Error::RetriesExhausted;
            DW_ERROR("[CONN] Max reconnection attempts reached (" << cfg_.max_reconnect_attempts << "). Giving up.");
            set_state_(State::Error);
            return;
        }

        ++attempts_;
        const std::int64_t delay = backoff_delay(cfg_.reconnect_delay, attempts_);
        next_retry_at_ = Clock::now_ms() + delay;
        retry_armed_ = true;
        telemetry_.retry_scheduled_total.inc();
        DW_INFO("[CONN] Reconnecting in " << delay << "ms (attempt " << attempts_ << "/" << cfg_.max_reconnect_attempts << ")");
        set_state_(State::Reconnecting);
    }

    inline void heartbeat_(std::int64_t now) {
        if (now - last_pong_at_ > 2 * cfg_.heartbeat_interval) {
            telemetry_.heartbeat_timeouts_total.inc();
            DW_WARN("[CONN] Heartbeat timeout: no pong for " << (now - last_pong_at_) << "ms (Forcing reconnect).");
            heartbeat_armed_ = false;
            last_error_ = Error::Timeout;
            ws_->close(close_code::HeartbeatTimeout);
            drain_events_();
            if (state_ == State::Connected) {
                // Socket did not report its close, treat it as done
                on_closed_(close_code::HeartbeatTimeout);
            }
            return;
        }

        if (send_raw_(protocol::to_json(protocol::make_ping(now)))) {
            telemetry_.pings_sent_total.inc();
        }
        next_heartbeat_at_ = now + cfg_.heartbeat_interval;
    }

    inline void drain_events_() {
        websocket::Event ev;
        while (ws_) {
            const std::uint64_t gen = generation_;
            if (!ws_->poll_event(ev)) {
                break;
            }
            if (gen != generation_) {
                // Socket was replaced from inside a handler, its events are stale
                continue;
            }
            switch (ev.type) {
            case websocket::EventType::Error:
                last_error_ = ev.error;
                DW_WARN("[CONN] Transport error: " << to_string(ev.error));
                break;
            case websocket::EventType::Close:
                on_closed_(ev.close_code);
                break;
            }
        }
    }

    inline void on_message_(std::string_view text) {
        telemetry_.messages_received_total.inc();

        protocol::RawFrame frame;
        if (!codec_.decode(text, frame)) {
            telemetry_.raw_messages_total.inc();
        }

        const std::int64_t now = Clock::now_ms();
        if (!frame.timestamp) {
            frame.timestamp = static_cast<double>(now);
        }

        if (frame.type == protocol::frame_type::Pong) {
            last_pong_at_ = now;
            telemetry_.pongs_received_total.inc();
            return;
        }

        router_.route(frame);
    }

    inline bool send_raw_(const std::string& text) {
        if (!ws_->send(text)) {
            DW_WARN("[CONN] Transport rejected outbound frame");
            return false;
        }
        return true;
    }

    inline void create_transport_() {
        retire_transport_();
        ws_ = std::make_unique<WS>();
        ws_->set_protocols(cfg_.protocols);
        const std::uint64_t gen = generation_;
        ws_->set_message_callback([this, gen](std::string_view text) {
            if (gen != generation_) {
                return;
            }
            on_message_(text);
        });
    }

    inline void retire_transport_() {
        ++generation_;
        if (ws_) {
            retired_.push_back(std::move(ws_));
        }
    }

    inline void set_state_(State new_state) {
        if (state_ == new_state) {
            return;
        }
        DW_TRACE("[CONN] State:  " << to_string(state_) << " -> " << to_string(new_state));
        state_ = new_state;
        status_listeners_->notify("status", new_state);
    }

private:
    Config cfg_;

    State state_{State::Disconnected};
    Error last_error_{Error::None};

    std::unique_ptr<WS> ws_;
    std::vector<std::unique_ptr<WS>> retired_;
    std::uint64_t generation_{0};

    // Retry policy
    int attempts_{0};
    bool retry_armed_{false};
    std::int64_t next_retry_at_{0};

    // Heartbeat
    bool heartbeat_armed_{false};
    std::int64_t next_heartbeat_at_{0};
    std::int64_t last_pong_at_{0};

    protocol::Codec codec_;
    subscription::Registry registry_;
    router::Router router_;

    std::shared_ptr<core::ListenerSet<State>> status_listeners_;

    telemetry::Connection telemetry_;
};

} // namespace dashwire::transport
