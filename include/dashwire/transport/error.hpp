#pragma once

#include <ostream>
#include <string_view>

namespace dashwire {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

This enum represents semantic transport failures, abstracted away from
library-specific error codes (Boost.Beast, ASIO, etc.).

Connection::connect() returns it for a failed first attempt, sockets report it
through websocket::Event::make_error(), and Connection::last_error() keeps the
most recent one for the facade.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current state (e.g. after dispose)

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Connection was closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint closed the connection (CLOSE frame)

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Transport-level timeout (heartbeat, stalled network)
    ConnectionFailed, // Connection attempt failed (DNS, TCP connect, routing)
    HandshakeFailed,  // WebSocket upgrade rejected or malformed

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame or protocol violation

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure, // Unclassified transport failure
    RetriesExhausted, // Reconnection policy gave up after max attempts
};


/// Optional helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    case Error::RetriesExhausted:  return "RetriesExhausted";
    default:                       return "Unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, Error err) {
    return os << to_string(err);
}

} // namespace transport
} // namespace dashwire
