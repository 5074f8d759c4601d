#pragma once

/*
===============================================================================
 history::EventBuffer
===============================================================================

Bounded, queryable history of normalized events.

Composes a RingBuffer<NormalizedEvent> and keeps per-type and per-channel
counters in step with it: every add consumes the eviction result of the ring
so counters always describe exactly the retained events.

Events without a channel are grouped under "default" by the channel queries
and statistics.

JSON export/import:
  to_json()        array of {"id","type","channel"?,"payload","timestamp","receivedAt"}
  from_json(text)  parses and validates everything first; on failure throws
                   SerializationError and leaves the contents untouched,
                   otherwise replaces the contents (oldest events evicted if
                   the import exceeds capacity)
===============================================================================
*/

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "dashwire/event/normalized_event.hpp"
#include "dashwire/history/ring_buffer.hpp"

namespace dashwire::history {

inline constexpr std::string_view DefaultChannel = "default";

class SerializationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct TimeRange {
    std::int64_t earliest{0};
    std::int64_t latest{0};

    bool operator==(const TimeRange&) const = default;
};

struct Stats {
    std::size_t total_count{0};
    std::map<std::string, std::size_t> by_type;
    std::map<std::string, std::size_t> by_channel;
    std::optional<TimeRange> time_range;   // empty when the buffer is empty
};

class EventBuffer {
public:
    using Event = event::NormalizedEvent;

    explicit EventBuffer(std::size_t capacity = 1000);

    // Returns the evicted event, if any
    std::optional<Event> add(Event ev);

    // Returns every evicted event, oldest first
    std::vector<Event> add_batch(std::vector<Event> events);

    // --- Queries (chronological unless stated otherwise) -------------------

    [[nodiscard]] std::vector<Event> get_all() const { return ring_.get_all(); }
    [[nodiscard]] std::vector<Event> get_recent(std::size_t k) const { return ring_.get_recent(k); }
    [[nodiscard]] std::vector<Event> get_oldest(std::size_t k) const { return ring_.get_oldest(k); }

    [[nodiscard]] std::vector<Event> get_by_type(std::string_view type) const;
    [[nodiscard]] std::vector<Event> get_by_channel(std::string_view channel) const;

    // Events with start <= timestamp <= end
    [[nodiscard]] std::vector<Event> get_by_time_range(std::int64_t start, std::int64_t end) const;

    // Events with timestamp >= now - window_ms
    [[nodiscard]] std::vector<Event> get_recent_by_time(std::int64_t window_ms, std::int64_t now_ms) const;

    // Newest event of `type`
    [[nodiscard]] std::optional<Event> get_latest_by_type(std::string_view type) const;

    [[nodiscard]] std::size_t count_by_type(std::string_view type) const;
    [[nodiscard]] std::size_t count_by_channel(std::string_view channel) const;

    [[nodiscard]] Stats get_stats() const;

    // --- Serialization -----------------------------------------------------

    [[nodiscard]] std::string to_json() const;
    void from_json(std::string_view text);

    // --- Capacity ----------------------------------------------------------

    void clear();

    [[nodiscard]] std::size_t size() const noexcept { return ring_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return ring_.capacity(); }
    [[nodiscard]] bool empty() const noexcept { return ring_.empty(); }
    [[nodiscard]] bool full() const noexcept { return ring_.full(); }

    [[nodiscard]] const RingBuffer<Event>& ring() const noexcept { return ring_; }

private:
    void count_in_(const Event& ev);
    void count_out_(const Event& ev);

private:
    RingBuffer<Event> ring_;
    std::map<std::string, std::size_t, std::less<>> type_counts_;
    std::map<std::string, std::size_t, std::less<>> channel_counts_;
};

// Channel used by channel queries for `ev`
[[nodiscard]]
inline std::string_view effective_channel(const event::NormalizedEvent& ev) noexcept {
    return ev.channel ? std::string_view{*ev.channel} : DefaultChannel;
}

} // namespace dashwire::history
