#pragma once

/*
===============================================================================
 dashwire::transport::websocket::Event
===============================================================================

Control-plane event emitted by a WebSocket implementation and drained by the
owning Connection through poll_event().

Replaces on_error / on_close callbacks with a deterministic, poll-driven
event queue. Text messages (data-plane) are delivered through the message
callback instead.

-------------------------------------------------------------------------------
 Contract
-------------------------------------------------------------------------------

• Close  → socket closed (local or remote), carries the close code
• Error  → transport-level failure, usually followed by a Close

• Exactly one Close per opened socket
• close(code) on an open socket yields a Close carrying that same code
• Events are never dropped

Event is a small, trivially copyable POD.
===============================================================================
*/

#include <cstdint>
#include <type_traits>

#include "dashwire/transport/error.hpp"

namespace dashwire::transport::websocket {

enum class EventType : std::uint8_t {
    Close = 0,
    Error = 1,
};

struct Event {

    EventType type{EventType::Close};
    std::uint16_t close_code{0};          // valid only if type == EventType::Close
    transport::Error error{Error::None};  // valid only if type == EventType::Error

    static constexpr Event make_close(std::uint16_t code) noexcept {
        Event ev;
        ev.type = EventType::Close;
        ev.close_code = code;
        return ev;
    }

    static constexpr Event make_error(transport::Error e) noexcept {
        Event ev;
        ev.type  = EventType::Error;
        ev.error = e;
        return ev;
    }
};

static_assert(std::is_trivially_copyable_v<Event>, "websocket::Event must be trivially copyable");
static_assert(sizeof(Event) <= 16, "websocket::Event should remain small");

} // namespace dashwire::transport::websocket
