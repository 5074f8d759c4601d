#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>

namespace dashwire {

// ============================================================================
// ClockConcept
//
// Source of wall-clock time in milliseconds since the Unix epoch.
// Every deadline (heartbeat, reconnect backoff, batch window) and every event
// timestamp is read from the same clock, so tests can substitute a manual one.
// ============================================================================
template<class C>
concept ClockConcept = requires {
    { C::now_ms() } noexcept -> std::same_as<std::int64_t>;
};

struct SystemClock {
    [[nodiscard]]
    static std::int64_t now_ms() noexcept {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }
};

static_assert(ClockConcept<SystemClock>);

} // namespace dashwire
