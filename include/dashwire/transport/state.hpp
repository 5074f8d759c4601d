#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

namespace dashwire {
namespace transport {

// -----------------------------------------------------------------------------
// Connection lifecycle states
//
// Disconnected and Error are the only states without an active socket.
// Error is terminal until the caller issues a new connect().
// -----------------------------------------------------------------------------
enum class State : std::uint8_t {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Error
};

inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
    case State::Disconnected: return "disconnected";
    case State::Connecting:   return "connecting";
    case State::Connected:    return "connected";
    case State::Reconnecting: return "reconnecting";
    case State::Error:        return "error";
    default:                  return "unknown";
    }
}

inline std::ostream& operator<<(std::ostream& os, State s) {
    return os << to_string(s);
}

// -----------------------------------------------------------------------------
// WebSocket close codes with meaning to the connection policy
// -----------------------------------------------------------------------------
namespace close_code {

inline constexpr std::uint16_t Normal           = 1000; // disconnect()
inline constexpr std::uint16_t GoingAway        = 1001; // client disposal
inline constexpr std::uint16_t Abnormal         = 1006; // dropped without CLOSE frame
inline constexpr std::uint16_t HeartbeatTimeout = 4000; // pong not seen in time

// Intentional closes end in Disconnected, everything else reconnects
[[nodiscard]]
inline constexpr bool is_intentional(std::uint16_t code) noexcept {
    return code == Normal || code == GoingAway;
}

} // namespace close_code

} // namespace transport
} // namespace dashwire
