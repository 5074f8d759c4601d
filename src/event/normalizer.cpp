#include "dashwire/event/normalizer.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>

#include "dashwire/core/json.hpp"
#include "dashwire/log/logger.hpp"

namespace dashwire::event {

namespace {

constexpr std::string_view CustomPrefix = "custom:";

std::atomic<std::uint64_t> g_event_seq{0};

constexpr bool is_custom_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
        || c == '_' || c == '.' || c == ':' || c == '-';
}

} // namespace

const std::vector<std::string_view>& known_event_types() noexcept {
    static const std::vector<std::string_view> types = {
        "agent:status",
        "agent:update",
        "agent:spawned",
        "agent:terminated",
        "task:created",
        "task:update",
        "task:completed",
        "task:failed",
        "message:sent",
        "message:received",
        "memory:operation",
        "metrics:update",
        "topology:change",
        "swarm:status",
        "system:alert",
    };
    return types;
}

bool is_custom_type(std::string_view type) noexcept {
    if (type.size() <= CustomPrefix.size() || type.substr(0, CustomPrefix.size()) != CustomPrefix) {
        return false;
    }
    const auto name = type.substr(CustomPrefix.size());
    return std::all_of(name.begin(), name.end(), is_custom_char);
}

std::int64_t normalize_timestamp(std::optional<double> ts, std::int64_t now_ms) noexcept {
    if (!ts || !std::isfinite(*ts)) {
        return now_ms;
    }
    double value = *ts;
    if (value < SecondsThreshold) {
        value *= 1000.0;
    }
    // Outside int64 range cannot be represented, treat as missing
    if (!(value >= MinTimestamp && value < MaxTimestamp)) {
        return now_ms;
    }
    return static_cast<std::int64_t>(std::llround(value));
}

std::string next_event_id(std::int64_t now_ms) {
    const std::uint64_t seq = g_event_seq.fetch_add(1, std::memory_order_relaxed) + 1;
    std::string id = "evt-";
    json::append(id, now_ms);
    id += '-';
    json::append(id, seq);
    return id;
}

Normalizer::Normalizer(const std::vector<std::string>& extra_types)
    : extra_types_(extra_types.begin(), extra_types.end())
{}

bool Normalizer::accepts(std::string_view type) const {
    const auto& known = known_event_types();
    if (std::find(known.begin(), known.end(), type) != known.end()) {
        return true;
    }
    if (is_custom_type(type)) {
        return true;
    }
    return extra_types_.find(std::string(type)) != extra_types_.end();
}

NormalizedEvent Normalizer::normalize(const protocol::RawFrame& frame, std::int64_t now_ms) const {
    NormalizedEvent ev;
    ev.id = next_event_id(now_ms);
    ev.type = frame.type;
    ev.channel = frame.channel;
    if (frame.payload && !frame.payload->empty()) {
        ev.payload = *frame.payload;
    }
    ev.timestamp = normalize_timestamp(frame.timestamp, now_ms);
    ev.received_at = now_ms;
    return ev;
}

std::optional<NormalizedEvent> Normalizer::try_normalize(const protocol::RawFrame& frame, std::int64_t now_ms) {
    if (!accepts(frame.type)) {
        ++rejected_;
        DW_DEBUG("[NORMALIZER] Rejected frame of unknown type {" << frame.type << "}");
        return std::nullopt;
    }
    return normalize(frame, now_ms);
}

} // namespace dashwire::event
