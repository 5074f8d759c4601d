#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dashwire::event {

// ============================================================================
// NormalizedEvent
//
// A validated frame with a process-unique id and millisecond timestamps.
// `payload` is minified JSON text ("null" when the frame carried none).
// ============================================================================
struct NormalizedEvent {
    std::string id;
    std::string type;
    std::optional<std::string> channel;
    std::string payload{"null"};
    std::int64_t timestamp{0};     // ms since epoch, event time
    std::int64_t received_at{0};   // ms since epoch, local receive time

    bool operator==(const NormalizedEvent&) const = default;
};

// ============================================================================
// Batch
//
// Events flushed together by the aggregator. `sequence` increases by one per
// flushed batch and is embedded in `id` as "batch-<sequence>-<flush ms>".
// ============================================================================
struct Batch {
    std::vector<NormalizedEvent> events;
    std::string id;
    std::uint64_t sequence{0};
    std::int64_t start_time{0};    // received_at of the first event
    std::int64_t end_time{0};      // received_at of the last event

    [[nodiscard]]
    std::size_t event_count() const noexcept { return events.size(); }
};

} // namespace dashwire::event
