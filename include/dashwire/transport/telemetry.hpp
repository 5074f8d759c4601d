#pragma once

#include "dashwire/metrics/counter.hpp"

namespace dashwire::transport::telemetry {

// ============================================================================
// Connection Telemetry
//
// Observes connection-level state transitions and decisions.
// Mechanical facts only. Updated from the polling thread.
// ============================================================================

struct Connection final {
    // ---------------------------------------------------------------------
    // Lifecycle & state transitions
    // ---------------------------------------------------------------------

    // connect() invoked by user
    metrics::counter32 connect_calls_total;

    // Successfully reached State::Connected (first attempt or retry)
    metrics::counter32 connect_success_total;

    // Failed connection attempt (first attempt or retry)
    metrics::counter32 connect_failure_total;

    // Explicit disconnect() invoked by user
    metrics::counter32 disconnect_calls_total;

    // Socket closed with a non-intentional code while connected
    metrics::counter32 unexpected_close_total;

    // ---------------------------------------------------------------------
    // Liveness decisions
    // ---------------------------------------------------------------------

    metrics::counter64 pings_sent_total;
    metrics::counter64 pongs_received_total;

    // Forced close because no pong arrived within two intervals
    metrics::counter32 heartbeat_timeouts_total;

    // ---------------------------------------------------------------------
    // Retry mechanics (decisions, not timing)
    // ---------------------------------------------------------------------

    // Entered State::Reconnecting
    metrics::counter32 retry_scheduled_total;

    // Retry timer expired and an attempt was made
    metrics::counter32 retry_attempts_total;

    // Policy gave up (State::Error)
    metrics::counter32 retry_exhausted_total;

    // ---------------------------------------------------------------------
    // Message handoff (WS → router boundary)
    // ---------------------------------------------------------------------

    metrics::counter64 messages_received_total;

    // Messages downgraded to type "raw"
    metrics::counter64 raw_messages_total;

    // ---------------------------------------------------------------------
    // Send gating
    // ---------------------------------------------------------------------

    metrics::counter64 send_calls_total;

    // send() rejected because the socket was not open
    metrics::counter64 send_rejected_total;
};

} // namespace dashwire::transport::telemetry
