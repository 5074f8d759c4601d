#pragma once

/*
===============================================================================
 event::Normalizer
===============================================================================

Validates frames against the known event vocabulary and turns them into
NormalizedEvent records.

Accepted types:
  • the built-in dashboard vocabulary (agent:*, task:*, message:*, ...)
  • any "custom:<name>" type, <name> made of [A-Za-z0-9_.:-]
  • extra types supplied at construction

Normalization:
  • id          fresh, unique for the process lifetime
  • timestamp   values below 1e12 are read as seconds and scaled to ms,
                a missing timestamp becomes `now`
  • received_at `now`
===============================================================================
*/

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "dashwire/event/normalized_event.hpp"
#include "dashwire/protocol/frame.hpp"

namespace dashwire::event {

// Timestamps below this are taken to be in seconds
inline constexpr double SecondsThreshold = 1e12;

// Representable millisecond range, [-2^63, 2^63)
inline constexpr double MinTimestamp = -0x1p63;
inline constexpr double MaxTimestamp = 0x1p63;

// The built-in event vocabulary
[[nodiscard]]
const std::vector<std::string_view>& known_event_types() noexcept;

// True for "custom:" followed by one or more of [A-Za-z0-9_.:-]
[[nodiscard]]
bool is_custom_type(std::string_view type) noexcept;

// Applies the seconds-vs-milliseconds heuristic
[[nodiscard]]
std::int64_t normalize_timestamp(std::optional<double> ts, std::int64_t now_ms) noexcept;

// Process-wide unique event id
[[nodiscard]]
std::string next_event_id(std::int64_t now_ms);

class Normalizer {
public:
    explicit Normalizer(const std::vector<std::string>& extra_types = {});

    [[nodiscard]]
    bool accepts(std::string_view type) const;

    // Builds the event without validating the type
    [[nodiscard]]
    NormalizedEvent normalize(const protocol::RawFrame& frame, std::int64_t now_ms) const;

    // Validates, then normalizes. Rejected frames are logged and counted.
    [[nodiscard]]
    std::optional<NormalizedEvent> try_normalize(const protocol::RawFrame& frame, std::int64_t now_ms);

    [[nodiscard]] std::uint64_t rejected_total() const noexcept { return rejected_; }

private:
    std::unordered_set<std::string> extra_types_;
    std::uint64_t rejected_{0};
};

} // namespace dashwire::event
