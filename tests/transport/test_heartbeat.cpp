/*
===============================================================================
 transport::Connection - heartbeat
===============================================================================

Covered contracts:

- A ping {"type":"ping","timestamp":<now>} goes out every heartbeat_interval
- Pongs refresh liveness and are never routed to handlers
- No pong for more than two intervals force-closes the socket with 4000,
  which is treated as an unexpected close (reconnect)
- A socket that never reports the forced close is still torn down
- heartbeat_interval = 0 disables the heartbeat
- disconnect() stops the heartbeat
===============================================================================
*/

#include <iostream>
#include <string>

#include "common/harness/connection.hpp"

using dashwire::test::ConnectionHarness;

namespace {

constexpr std::int64_t Interval = 1000;

Config heartbeat_config(std::int64_t interval = Interval) {
    Config cfg;
    cfg.heartbeat_interval = interval;
    cfg.reconnect_delay = 500;
    return cfg;
}

std::string ping_at(std::int64_t ms) {
    return R"({"type":"ping","timestamp":)" + std::to_string(ms) + "}";
}

} // namespace

// -----------------------------------------------------------------------------
// Ping cadence
// -----------------------------------------------------------------------------
void test_ping_cadence() {
    std::cout << "[TEST] heartbeat ping cadence\n";

    ConnectionHarness h(heartbeat_config());
    const std::int64_t t0 = ManualClock::now_ms();
    TEST_CHECK(h.connection->connect() == Error::None);
    TEST_CHECK(h.connection->heartbeat_active());
    TEST_CHECK(h.connection->next_heartbeat_at() == t0 + Interval);

    h.advance_and_poll(Interval - 1);
    TEST_CHECK(h.ws().count_sent_containing(R"("type":"ping")") == 0);

    h.advance_and_poll(1);
    TEST_CHECK(h.ws().count_sent(ping_at(t0 + Interval)) == 1);
    TEST_CHECK(h.connection->next_heartbeat_at() == t0 + 2 * Interval);

    h.ws().emit_message(R"({"type":"pong"})");
    h.advance_and_poll(Interval);
    TEST_CHECK(h.ws().count_sent(ping_at(t0 + 2 * Interval)) == 1);
    TEST_CHECK(h.connection->telemetry().pings_sent_total.load() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Answered pings keep the connection alive indefinitely
// -----------------------------------------------------------------------------
void test_pongs_keep_alive() {
    std::cout << "[TEST] heartbeat pongs keep alive\n";

    ConnectionHarness h(heartbeat_config());
    TEST_CHECK(h.connection->connect() == Error::None);

    for (int i = 0; i < 20; ++i) {
        h.advance_and_poll(Interval);
        h.ws().queue_message(R"({"type":"pong","timestamp":1})");
    }
    h.connection->poll();

    TEST_CHECK(h.connection->is_connected());
    TEST_CHECK(MockWebSocket::instances() == 1);
    TEST_CHECK(h.connection->telemetry().heartbeat_timeouts_total.load() == 0);
    // Pongs never reach handlers
    TEST_CHECK(h.frames.empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Silence beyond two intervals forces a 4000 close and a reconnect
// -----------------------------------------------------------------------------
void test_heartbeat_timeout() {
    std::cout << "[TEST] heartbeat timeout\n";

    ConnectionHarness h(heartbeat_config());
    TEST_CHECK(h.connection->connect() == Error::None);

    // Silence for exactly two intervals is tolerated
    h.advance_and_poll(Interval);
    h.advance_and_poll(Interval);
    TEST_CHECK(h.connection->is_connected());
    TEST_CHECK(h.ws().count_sent_containing(R"("type":"ping")") == 2);

    h.advance_and_poll(Interval);
    TEST_CHECK(MockWebSocket::last_close_code() == close_code::HeartbeatTimeout);
    TEST_CHECK(h.connection->state() == State::Reconnecting);
    TEST_CHECK(h.connection->last_error() == Error::Timeout);
    TEST_CHECK(!h.connection->heartbeat_active());
    TEST_CHECK(h.connection->telemetry().heartbeat_timeouts_total.load() == 1);

    h.advance_and_poll(500);
    TEST_CHECK(h.connection->is_connected());
    TEST_CHECK(MockWebSocket::instances() == 2);
    TEST_CHECK(h.connection->heartbeat_active());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A socket that swallows the close is still torn down
// -----------------------------------------------------------------------------
void test_timeout_on_silent_socket() {
    std::cout << "[TEST] heartbeat timeout on silent socket\n";

    ConnectionHarness h(heartbeat_config());
    TEST_CHECK(h.connection->connect() == Error::None);

    h.ws().go_silent();
    h.connection->force_last_pong(ManualClock::now_ms() - 10 * Interval);
    h.advance_and_poll(Interval);

    TEST_CHECK(h.connection->state() == State::Reconnecting);
    TEST_CHECK(!h.connection->has_ws());
    TEST_CHECK(h.connection->last_error() == Error::Timeout);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// heartbeat_interval = 0 disables the heartbeat
// -----------------------------------------------------------------------------
void test_heartbeat_disabled() {
    std::cout << "[TEST] heartbeat disabled\n";

    ConnectionHarness h(heartbeat_config(0));
    TEST_CHECK(h.connection->connect() == Error::None);
    TEST_CHECK(!h.connection->heartbeat_active());

    for (int i = 0; i < 10; ++i) {
        h.advance_and_poll(60'000);
    }
    TEST_CHECK(h.connection->is_connected());
    TEST_CHECK(h.ws().sent().empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// disconnect() stops the heartbeat
// -----------------------------------------------------------------------------
void test_disconnect_stops_heartbeat() {
    std::cout << "[TEST] disconnect() stops heartbeat\n";

    ConnectionHarness h(heartbeat_config());
    TEST_CHECK(h.connection->connect() == Error::None);
    h.connection->disconnect();
    TEST_CHECK(!h.connection->heartbeat_active());

    h.advance_and_poll(10 * Interval);
    TEST_CHECK(h.connection->state() == State::Disconnected);
    TEST_CHECK(h.connection->telemetry().pings_sent_total.load() == 0);
    TEST_CHECK(h.connection->telemetry().heartbeat_timeouts_total.load() == 0);

    std::cout << "[TEST] OK\n";
}

int main() {
    dashwire::log::Logger::instance().set_level(dashwire::log::Level::Fatal);

    test_ping_cadence();
    test_pongs_keep_alive();
    test_heartbeat_timeout();
    test_timeout_on_silent_socket();
    test_heartbeat_disabled();
    test_disconnect_stops_heartbeat();

    std::cout << "\n[ALL HEARTBEAT TESTS PASSED]\n";
    return 0;
}
