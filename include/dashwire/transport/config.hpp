#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace dashwire::transport {

// Upper bound of the reconnect backoff
inline constexpr std::int64_t MaxReconnectDelay = 30000; // ms

struct Config {
    std::string url{"ws://localhost:3001/"};
    std::vector<std::string> protocols{};
    int max_reconnect_attempts{10};
    std::int64_t reconnect_delay{1000};      // ms, backoff base
    std::int64_t heartbeat_interval{30000};  // ms, 0 disables the heartbeat
};

// delay = min(base * 2^(attempt - 1), 30000) for attempt >= 1
[[nodiscard]]
inline constexpr std::int64_t backoff_delay(std::int64_t base, int attempt) noexcept {
    if (base <= 0) {
        return 0;
    }
    std::int64_t delay = base;
    for (int i = 1; i < attempt && delay < MaxReconnectDelay; ++i) {
        delay *= 2;
    }
    return std::min(delay, MaxReconnectDelay);
}

static_assert(backoff_delay(1000, 1) == 1000);
static_assert(backoff_delay(1000, 2) == 2000);
static_assert(backoff_delay(1000, 5) == 16000);
static_assert(backoff_delay(1000, 6) == 30000);
static_assert(backoff_delay(1000, 60) == 30000);

} // namespace dashwire::transport
