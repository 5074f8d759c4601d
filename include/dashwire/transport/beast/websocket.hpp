#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket.hpp>

#include "dashwire/transport/error.hpp"
#include "dashwire/transport/websocket/events.hpp"
#include "dashwire/transport/websocket_concept.hpp"

namespace dashwire::transport::beast {

/*
===============================================================================
 transport::beast::WebSocket
===============================================================================

Boost.Beast WebSocket over plain TCP (ws://), conforming to WebSocketConcept.

connect() resolves, connects and performs the upgrade handshake synchronously.
After that the socket keeps one async read outstanding; the io_context is run
only inside poll_event(), so the message callback and every control event are
delivered on the polling thread.

One instance per connection attempt: a closed socket is never reopened.

wss:// is not supported by this implementation.
===============================================================================
*/
class WebSocket {
public:
    using MessageCallback = std::function<void(std::string_view)>;

    // Plain TCP only, wss:// is refused by Connection before connect()
    static constexpr bool supports_tls = false;

    WebSocket();
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    void set_protocols(const std::vector<std::string>& protocols);
    void set_message_callback(MessageCallback cb);

    [[nodiscard]]
    Error connect(const std::string& host, const std::string& port, const std::string& path) noexcept;

    void close(std::uint16_t code) noexcept;

    // Queues the frame; it is written from within poll_event()
    [[nodiscard]]
    bool send(const std::string& msg) noexcept;

    // Runs ready I/O handlers, then pops one control event
    [[nodiscard]]
    bool poll_event(websocket::Event& ev) noexcept;

    [[nodiscard]] bool is_open() const noexcept { return open_; }

private:
    using stream_t = boost::beast::websocket::stream<boost::asio::ip::tcp::socket>;

    void start_read_();
    void on_read_(const boost::beast::error_code& ec);
    void start_write_();
    void on_write_(const boost::beast::error_code& ec);
    void drop_queued_() noexcept;
    void fail_(Error err, std::uint16_t code);

private:
    boost::asio::io_context ioc_;
    stream_t ws_;
    boost::beast::flat_buffer buffer_;

    std::vector<std::string> protocols_;
    MessageCallback on_message_;
    std::deque<websocket::Event> events_;
    std::deque<std::string> outbox_;

    bool open_{false};
    bool closing_{false};
    bool writing_{false};
};

static_assert(WebSocketConcept<WebSocket>);

} // namespace dashwire::transport::beast
