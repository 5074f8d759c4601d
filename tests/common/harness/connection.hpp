/*
===============================================================================
 Connection Test Harness
===============================================================================

Purpose:
--------
Provides a minimal, deterministic harness for testing
dashwire::transport::Connection state-machine behavior.

Design:
-------
- Socket is MockWebSocket, time is ManualClock
- Connection lifetime is explicit and controllable
- Status transitions and routed frames are recorded in order
- No threads, no sleeps, no hidden behavior

This enables:
- Destructor behavior testing
- Re-creation of Connection within a single test
- Precise lifecycle assertions

===============================================================================
*/
#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "dashwire/transport/connection.hpp"
#include "common/manual_clock.hpp"
#include "common/mock_websocket.hpp"
#include "common/test_check.hpp"

// -----------------------------------------------------------------------------
// Setup environment
// -----------------------------------------------------------------------------
using namespace dashwire;
using namespace dashwire::transport;

using dashwire::test::ManualClock;
using dashwire::test::MockWebSocket;

using ConnectionUnderTest = Connection<MockWebSocket, ManualClock>;


namespace dashwire::test {
namespace harness {

struct Connection {
    // -------------------------------------------------------------------------
    // Connection under test (explicit lifetime)
    // -------------------------------------------------------------------------
    std::unique_ptr<ConnectionUnderTest> connection;

    // -------------------------------------------------------------------------
    // Observations
    // -------------------------------------------------------------------------
    std::vector<State> states;                  // every status transition
    std::vector<protocol::RawFrame> frames;     // every routed frame

    std::uint32_t connected_signals{0};
    std::uint32_t disconnected_signals{0};
    std::uint32_t reconnecting_signals{0};
    std::uint32_t error_signals{0};

    // -------------------------------------------------------------------------
    // Constructor
    // -------------------------------------------------------------------------
    explicit Connection(Config cfg = {}) {
        MockWebSocket::reset();
        ManualClock::reset();
        make_connection(std::move(cfg));
    }

    // -------------------------------------------------------------------------
    // Create a fresh Connection instance
    // -------------------------------------------------------------------------
    inline void make_connection(Config cfg = {}) {
        unsubs_.clear();
        connection = std::make_unique<ConnectionUnderTest>(std::move(cfg));
        unsubs_.push_back(connection->on_status_change([this](State s) { record_(s); }));
        unsubs_.push_back(connection->on_all([this](const protocol::RawFrame& f) { frames.push_back(f); }));
    }

    // -------------------------------------------------------------------------
    // Destroy the Connection (forces destructor behavior)
    // -------------------------------------------------------------------------
    inline void destroy_connection() {
        connection.reset(); // ~Connection() runs here
    }

    // Advances the clock, then polls once
    inline void advance_and_poll(std::int64_t ms) {
        ManualClock::advance(ms);
        connection->poll();
    }

    // Socket currently owned by the connection
    [[nodiscard]]
    inline MockWebSocket& ws() {
        TEST_CHECK(connection->has_ws());
        return connection->ws();
    }

    // -------------------------------------------------------------------------
    // Reset counters and logs (does NOT affect connection state)
    // -------------------------------------------------------------------------
    inline void reset_counters() noexcept {
        connected_signals = 0;
        disconnected_signals = 0;
        reconnecting_signals = 0;
        error_signals = 0;
        states.clear();
        frames.clear();
    }

private:
    inline void record_(State s) {
        switch (s) {
        case State::Connected:
            ++connected_signals;
            break;
        case State::Disconnected:
            ++disconnected_signals;
            break;
        case State::Reconnecting:
            ++reconnecting_signals;
            break;
        case State::Error:
            ++error_signals;
            break;
        case State::Connecting:
        default:
            break;
        }
        states.push_back(s);
    }

private:
    std::vector<Unsubscribe> unsubs_;
};

} // namespace harness

using ConnectionHarness = harness::Connection;

} // namespace dashwire::test
