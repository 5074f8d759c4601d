#pragma once

#include <cstddef>

#include "dashwire/event/aggregator.hpp"
#include "dashwire/transport/config.hpp"

namespace dashwire::stream {

// -----------------------------------------------------------------------------
// Client configuration
//
// Aggregate with defaults, meant for designated initializers:
//
//   stream::ClientConfig cfg{
//       .transport = { .url = "ws://localhost:3001/" },
//       .history_capacity = 5000,
//   };
// -----------------------------------------------------------------------------
struct ClientConfig {
    transport::Config transport{};
    event::AggregatorConfig aggregation{};
    std::size_t history_capacity{1000};
    bool auto_connect{false};
};

} // namespace dashwire::stream
