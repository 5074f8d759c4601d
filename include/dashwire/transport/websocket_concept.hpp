/*
===============================================================================
WebSocketConcept (Poll-Driven)
===============================================================================

Defines the minimal socket contract required by Connection.

The WebSocket implementation:

  • Performs a blocking connect + upgrade handshake
  • Declares through supports_tls whether wss:// endpoints can be reached
  • Delivers complete text messages through the message callback
  • Queues control-plane events (Close / Error) for poll_event()
  • Performs its I/O on the caller's thread inside poll_event()
  • Is fully lifecycle-managed by Connection (one instance per attempt)

-------------------------------------------------------------------------------
Threading Model
-------------------------------------------------------------------------------

Single thread. The message callback only ever fires from within
poll_event(), so handlers never run concurrently with the owner.

===============================================================================
*/
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include <concepts>

#include "dashwire/transport/error.hpp"
#include "dashwire/transport/websocket/events.hpp"


namespace dashwire::transport {

template<class WS>
concept WebSocketConcept =
    std::default_initializable<WS> &&
    requires(
        WS ws,
        const std::string& host,
        const std::string& port,
        const std::string& path,
        const std::string& msg,
        const std::vector<std::string>& protocols,
        std::function<void(std::string_view)> on_message,
        std::uint16_t code,
        websocket::Event& ev
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { WS::supports_tls } -> std::convertible_to<bool>;

    { ws.set_protocols(protocols) } -> std::same_as<void>;
    { ws.connect(host, port, path) } noexcept -> std::same_as<Error>;
    { ws.close(code) } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Data plane
    // ---------------------------------------------------------------------

    { ws.send(msg) } noexcept -> std::same_as<bool>;
    { ws.set_message_callback(on_message) } -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Control plane
    // ---------------------------------------------------------------------

    { ws.poll_event(ev) } noexcept -> std::same_as<bool>;
};

} // namespace dashwire::transport
