#pragma once

/*
================================================================================
dashwire - dashboard event-stream client
================================================================================

Primary entry point:

    dashwire::Client

a stream::Client bound to the Boost.Beast WebSocket backend and the system
clock. It is a thin composition of:
  - transport::Connection   (socket lifecycle, reconnect, heartbeat,
                             subscription replay, routing)
  - event::Aggregator       (validation, normalization, batching)
  - history::EventBuffer    (bounded, queryable event history)

Execution model: single-threaded and poll-driven. Nothing runs unless the
owner calls poll() (or run_while / run_until). connect() is the only
blocking call.

Minimal usage:

    dashwire::Client client{{ .transport = { .url = "ws://localhost:3001/" } }};
    client.subscribe("agents");
    client.on_batch([](const dashwire::event::Batch& b) { ... });
    if (client.connect() != dashwire::transport::Error::None) { ... }
    client.run_while([&] { return running; });
================================================================================
*/

#include "dashwire/log/logger.hpp"
#include "dashwire/stream/client.hpp"
#include "dashwire/transport/beast/websocket.hpp"


namespace dashwire {

using Client = stream::Client<transport::beast::WebSocket>;

} // namespace dashwire
