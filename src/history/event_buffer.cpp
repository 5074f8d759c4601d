#include "dashwire/history/event_buffer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <simdjson.h>

#include "dashwire/core/json.hpp"
#include "dashwire/event/normalizer.hpp"
#include "dashwire/log/logger.hpp"

namespace dashwire::history {

namespace {

void bump(std::map<std::string, std::size_t, std::less<>>& counts, std::string_view key) {
    auto it = counts.find(key);
    if (it == counts.end()) {
        counts.emplace(std::string(key), 1);
    } else {
        ++it->second;
    }
}

void drop(std::map<std::string, std::size_t, std::less<>>& counts, std::string_view key) {
    auto it = counts.find(key);
    if (it == counts.end()) {
        return;
    }
    if (--it->second == 0) {
        counts.erase(it);
    }
}

[[noreturn]]
void fail(std::size_t index, std::string_view what) {
    std::string msg = "invalid event history: element ";
    json::append(msg, static_cast<std::uint64_t>(index));
    msg += ": ";
    msg += what;
    throw SerializationError(msg);
}

// Accepts any JSON number, rounding fractional milliseconds
bool read_ms(simdjson::dom::element el, std::int64_t& out) {
    std::int64_t i = 0;
    if (el.is_int64() && !el.get_int64().get(i)) {
        out = i;
        return true;
    }
    double d = 0.0;
    if (el.is_number() && !el.get_double().get(d) && std::isfinite(d)
        && d >= event::MinTimestamp && d < event::MaxTimestamp) {
        out = static_cast<std::int64_t>(std::llround(d));
        return true;
    }
    return false;
}

} // namespace

EventBuffer::EventBuffer(std::size_t capacity)
    : ring_(capacity)
{}

std::optional<EventBuffer::Event> EventBuffer::add(Event ev) {
    count_in_(ev);
    auto evicted = ring_.add(std::move(ev));
    if (evicted) {
        count_out_(*evicted);
    }
    return evicted;
}

std::vector<EventBuffer::Event> EventBuffer::add_batch(std::vector<Event> events) {
    std::vector<Event> evicted;
    for (auto& ev : events) {
        if (auto old = add(std::move(ev))) {
            evicted.push_back(std::move(*old));
        }
    }
    if (!evicted.empty()) {
        DW_TRACE("[HISTORY] Evicted " << evicted.size() << " events (capacity=" << ring_.capacity() << ")");
    }
    return evicted;
}

std::vector<EventBuffer::Event> EventBuffer::get_by_type(std::string_view type) const {
    return ring_.find([type](const Event& ev) { return ev.type == type; });
}

std::vector<EventBuffer::Event> EventBuffer::get_by_channel(std::string_view channel) const {
    return ring_.find([channel](const Event& ev) { return effective_channel(ev) == channel; });
}

std::vector<EventBuffer::Event> EventBuffer::get_by_time_range(std::int64_t start, std::int64_t end) const {
    return ring_.find([start, end](const Event& ev) {
        return ev.timestamp >= start && ev.timestamp <= end;
    });
}

std::vector<EventBuffer::Event> EventBuffer::get_recent_by_time(std::int64_t window_ms, std::int64_t now_ms) const {
    const std::int64_t cutoff = now_ms - window_ms;
    return ring_.find([cutoff](const Event& ev) { return ev.timestamp >= cutoff; });
}

std::optional<EventBuffer::Event> EventBuffer::get_latest_by_type(std::string_view type) const {
    return ring_.find_last([type](const Event& ev) { return ev.type == type; });
}

std::size_t EventBuffer::count_by_type(std::string_view type) const {
    auto it = type_counts_.find(type);
    return it == type_counts_.end() ? 0 : it->second;
}

std::size_t EventBuffer::count_by_channel(std::string_view channel) const {
    auto it = channel_counts_.find(channel);
    return it == channel_counts_.end() ? 0 : it->second;
}

Stats EventBuffer::get_stats() const {
    Stats stats;
    stats.total_count = ring_.size();
    for (const auto& [type, n] : type_counts_) {
        stats.by_type.emplace(type, n);
    }
    for (const auto& [channel, n] : channel_counts_) {
        stats.by_channel.emplace(channel, n);
    }
    ring_.for_each([&stats](const Event& ev, std::size_t) {
        if (!stats.time_range) {
            stats.time_range = TimeRange{ev.timestamp, ev.timestamp};
            return;
        }
        stats.time_range->earliest = std::min(stats.time_range->earliest, ev.timestamp);
        stats.time_range->latest = std::max(stats.time_range->latest, ev.timestamp);
    });
    return stats;
}

std::string EventBuffer::to_json() const {
    std::string out;
    out.reserve(64 + ring_.size() * 128);
    out += '[';
    ring_.for_each([&out](const Event& ev, std::size_t i) {
        if (i > 0) out += ',';
        out += "{\"id\":";
        json::append_string(out, ev.id);
        out += ",\"type\":";
        json::append_string(out, ev.type);
        if (ev.channel) {
            out += ",\"channel\":";
            json::append_string(out, *ev.channel);
        }
        out += ",\"payload\":";
        out += ev.payload.empty() ? std::string_view{"null"} : std::string_view{ev.payload};
        out += ",\"timestamp\":";
        json::append(out, ev.timestamp);
        out += ",\"receivedAt\":";
        json::append(out, ev.received_at);
        out += '}';
    });
    out += ']';
    return out;
}

void EventBuffer::from_json(std::string_view text) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    auto error = parser.parse(text.data(), text.size()).get(root);
    if (error) {
        throw SerializationError(std::string("invalid event history: ") + simdjson::error_message(error));
    }

    simdjson::dom::array arr;
    if (root.get_array().get(arr)) {
        throw SerializationError("invalid event history: expected a JSON array");
    }

    // Parse everything before touching the current contents
    std::vector<Event> events;
    events.reserve(arr.size());
    std::size_t index = 0;
    for (simdjson::dom::element el : arr) {
        simdjson::dom::object obj;
        if (el.get_object().get(obj)) {
            fail(index, "expected an object");
        }

        Event ev;
        std::string_view sv;
        if (obj["id"].get_string().get(sv)) {
            fail(index, "missing string 'id'");
        }
        ev.id = std::string(sv);
        if (obj["type"].get_string().get(sv)) {
            fail(index, "missing string 'type'");
        }
        ev.type = std::string(sv);

        simdjson::dom::element field;
        if (!obj["channel"].get(field) && !field.is_null()) {
            if (field.get_string().get(sv)) {
                fail(index, "'channel' must be a string");
            }
            ev.channel = std::string(sv);
        }

        if (!obj["payload"].get(field)) {
            ev.payload = simdjson::minify(field);
        }

        if (obj["timestamp"].get(field) || !read_ms(field, ev.timestamp)) {
            fail(index, "missing numeric 'timestamp'");
        }

        if (obj["receivedAt"].get(field)) {
            ev.received_at = ev.timestamp;
        } else if (!read_ms(field, ev.received_at)) {
            fail(index, "'receivedAt' must be a number");
        }

        events.push_back(std::move(ev));
        ++index;
    }

    clear();
    add_batch(std::move(events));
    DW_DEBUG("[HISTORY] Imported " << index << " events (retained=" << ring_.size() << ")");
}

void EventBuffer::clear() {
    ring_.clear();
    type_counts_.clear();
    channel_counts_.clear();
}

void EventBuffer::count_in_(const Event& ev) {
    bump(type_counts_, ev.type);
    bump(channel_counts_, effective_channel(ev));
}

void EventBuffer::count_out_(const Event& ev) {
    drop(type_counts_, ev.type);
    drop(channel_counts_, effective_channel(ev));
}

} // namespace dashwire::history
