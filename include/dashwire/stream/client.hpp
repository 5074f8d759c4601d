#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "dashwire/core/clock.hpp"
#include "dashwire/core/listeners.hpp"
#include "dashwire/event/aggregator.hpp"
#include "dashwire/history/event_buffer.hpp"
#include "dashwire/protocol/frame.hpp"
#include "dashwire/stream/config.hpp"
#include "dashwire/transport/connection.hpp"
#include "dashwire/log/logger.hpp"

namespace dashwire::stream {

/*
===============================================================================
 dashwire::stream::Client
===============================================================================

User-facing dashboard event-stream client.

Composes:
  • transport::Connection   socket lifecycle, subscriptions, routing
  • event::Aggregator       validation, normalization, batching
  • history::EventBuffer    bounded queryable history

Data flow:

    socket ─► Connection ─► Router ─┬─► type / channel / wildcard handlers
                                    └─► raw-message callback
                                        └─► Aggregator ─► Batch
                                                           ├─► history
                                                           └─► batch callback

With aggregation disabled, accepted frames are normalized and written to the
history one by one, and no batches are emitted.

Lifetime:
  • dispose() (also run by the destructor) synchronously removes every
    internal listener, drops pending aggregation and closes the socket with
    code 1001. No handler of this client fires afterwards.
  • A disposed client refuses to connect again.

Threading: single-threaded, poll-driven. Call poll() (or run_while /
run_until) from the owning thread.
===============================================================================
*/

template<transport::WebSocketConcept WS, ClockConcept Clock = SystemClock>
class Client {
public:
    using Frame = protocol::RawFrame;
    using Handler = std::function<void(const Frame&)>;
    using MessageCallback = std::function<void(const Frame&)>;
    using BatchCallback = std::function<void(const event::Batch&)>;
    using StatusListener = std::function<void(transport::State)>;

    explicit Client(ClientConfig cfg = {})
        : cfg_(std::move(cfg))
        , connection_(cfg_.transport)
        , aggregator_(cfg_.aggregation)
        , history_(cfg_.history_capacity)
    {
        internal_.push_back(connection_.on_all([this](const Frame& frame) { ingest_(frame); }));
        internal_.push_back(aggregator_.on_batch([this](const event::Batch& batch) { store_(batch); }));

        if (cfg_.auto_connect) {
            const auto err = connect();
            if (err != transport::Error::None) {
                DW_WARN("[CLIENT] Auto-connect failed (" << transport::to_string(err) << ")");
            }
        }
    }

    ~Client() {
        dispose();
    }

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    [[nodiscard]]
    transport::Error connect() {
        if (disposed_) {
            DW_WARN("[CLIENT] connect() called on a disposed client. Ignoring.");
            return transport::Error::InvalidState;
        }
        return connection_.connect();
    }

    void disconnect() {
        connection_.disconnect(transport::close_code::Normal);
    }

    // Drives the connection and the batch window
    void poll() {
        connection_.poll();
        aggregator_.poll();
    }

    void dispose() {
        if (disposed_) {
            return;
        }
        disposed_ = true;
        for (auto& unsubscribe : internal_) {
            unsubscribe();
        }
        internal_.clear();
        aggregator_.reset();
        on_message_ = nullptr;
        on_batch_ = nullptr;
        connection_.disconnect(transport::close_code::GoingAway);
        DW_DEBUG("[CLIENT] Disposed");
    }

    // -------------------------------------------------------------------------
    // Run loops
    // -------------------------------------------------------------------------
    //
    // run_while(cond) polls while the user condition holds.
    // run_until(stop) polls until the user condition becomes true.
    //
    // A positive `tick` sleeps between polls, zero spins.
    // -------------------------------------------------------------------------
    template<class ContinueFn>
    void run_while(ContinueFn&& should_continue, std::chrono::milliseconds tick = std::chrono::milliseconds{10}) {
        const bool cooperative = (tick.count() > 0);
        while (should_continue()) [[likely]] {
            poll();
            if (cooperative) [[likely]] {
                std::this_thread::sleep_for(tick);
            }
        }
    }

    template<class StopFn>
    void run_until(StopFn&& should_stop, std::chrono::milliseconds tick = std::chrono::milliseconds{10}) {
        const bool cooperative = (tick.count() > 0);
        while (!should_stop()) [[likely]] {
            poll();
            if (cooperative) [[likely]] {
                std::this_thread::sleep_for(tick);
            }
        }
    }

    // -------------------------------------------------------------------------
    // Subscriptions & sending
    // -------------------------------------------------------------------------

    bool subscribe(const std::string& channel) { return connection_.subscribe(channel); }
    bool unsubscribe(const std::string& channel) { return connection_.unsubscribe(channel); }

    [[nodiscard]]
    bool send(const Frame& frame) { return connection_.send(frame); }

    // -------------------------------------------------------------------------
    // Handlers
    // -------------------------------------------------------------------------

    [[nodiscard]]
    Unsubscribe on(std::string_view type, Handler handler) {
        return connection_.on(type, std::move(handler));
    }

    [[nodiscard]]
    Unsubscribe on_channel(std::string_view channel, Handler handler) {
        return connection_.on_channel(channel, std::move(handler));
    }

    [[nodiscard]]
    Unsubscribe on_all(Handler handler) {
        return connection_.on_all(std::move(handler));
    }

    [[nodiscard]]
    Unsubscribe on_status_change(StatusListener listener) {
        return connection_.on_status_change(std::move(listener));
    }

    // Every routed frame, before aggregation
    void on_message(MessageCallback cb) { on_message_ = std::move(cb); }

    // Every flushed batch, after it was written to the history
    void on_batch(BatchCallback cb) { on_batch_ = std::move(cb); }

    // Flushes pending aggregation now
    void flush() { aggregator_.flush(); }

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] transport::State status() const noexcept { return connection_.state(); }
    [[nodiscard]] bool is_connected() const noexcept { return connection_.is_connected(); }
    [[nodiscard]] transport::Error last_error() const noexcept { return connection_.last_error(); }
    [[nodiscard]] bool disposed() const noexcept { return disposed_; }

    [[nodiscard]]
    const std::vector<std::string>& subscribed_channels() const noexcept {
        return connection_.subscriptions().channels();
    }

    [[nodiscard]] history::EventBuffer& history() noexcept { return history_; }
    [[nodiscard]] const history::EventBuffer& history() const noexcept { return history_; }

    [[nodiscard]] transport::Connection<WS, Clock>& connection() noexcept { return connection_; }
    [[nodiscard]] const event::Aggregator<Clock>& aggregator() const noexcept { return aggregator_; }
    [[nodiscard]] const ClientConfig& config() const noexcept { return cfg_; }

private:
    void ingest_(const Frame& frame) {
        if (on_message_) {
            try {
                on_message_(frame);
            }
            catch (const std::exception& ex) {
                DW_ERROR("[CLIENT] Message callback threw: " << ex.what());
            }
            catch (...) {
                DW_ERROR("[CLIENT] Message callback threw unknown exception");
            }
        }

        if (cfg_.aggregation.enabled) {
            aggregator_.ingest(frame);
            return;
        }

        if (auto ev = aggregator_.normalizer().try_normalize(frame, Clock::now_ms())) {
            history_.add(std::move(*ev));
        }
    }

    void store_(const event::Batch& batch) {
        history_.add_batch(batch.events);
        if (on_batch_) {
            on_batch_(batch);
        }
    }

private:
    ClientConfig cfg_;

    transport::Connection<WS, Clock> connection_;
    event::Aggregator<Clock> aggregator_;
    history::EventBuffer history_;

    MessageCallback on_message_;
    BatchCallback on_batch_;

    std::vector<Unsubscribe> internal_;
    bool disposed_{false};
};

} // namespace dashwire::stream
