#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "dashwire/core/json.hpp"

namespace dashwire::protocol {

// Frame types with meaning to the transport itself
namespace frame_type {
inline constexpr std::string_view Ping        = "ping";
inline constexpr std::string_view Pong        = "pong";
inline constexpr std::string_view Subscribe   = "subscribe";
inline constexpr std::string_view Unsubscribe = "unsubscribe";
inline constexpr std::string_view Raw         = "raw";
} // namespace frame_type

// ============================================================================
// RawFrame
//
// A decoded inbound frame, or an outbound frame before serialization.
// `payload` holds minified JSON text and is never interpreted by the core.
// ============================================================================
struct RawFrame {
    std::string type;
    std::optional<std::string> channel;
    std::optional<std::string> payload;
    std::optional<double> timestamp;

    bool operator==(const RawFrame&) const = default;
};

// Serializes a frame as {"type":..,"channel":..,"payload":..,"timestamp":..}
// omitting absent members.
[[nodiscard]]
inline std::string to_json(const RawFrame& frame) {
    std::string out;
    out.reserve(32 + frame.type.size() + (frame.payload ? frame.payload->size() : 0));
    out += "{\"type\":";
    json::append_string(out, frame.type);
    if (frame.channel) {
        out += ",\"channel\":";
        json::append_string(out, *frame.channel);
    }
    if (frame.payload) {
        out += ",\"payload\":";
        out += frame.payload->empty() ? std::string_view{"null"} : std::string_view{*frame.payload};
    }
    if (frame.timestamp) {
        out += ",\"timestamp\":";
        json::append(out, *frame.timestamp);
    }
    out += '}';
    return out;
}

[[nodiscard]]
inline RawFrame make_subscribe(const std::string& channel) {
    return RawFrame{std::string(frame_type::Subscribe), channel, std::nullopt, std::nullopt};
}

[[nodiscard]]
inline RawFrame make_unsubscribe(const std::string& channel) {
    return RawFrame{std::string(frame_type::Unsubscribe), channel, std::nullopt, std::nullopt};
}

[[nodiscard]]
inline RawFrame make_ping(std::int64_t now_ms) {
    return RawFrame{std::string(frame_type::Ping), std::nullopt, std::nullopt, static_cast<double>(now_ms)};
}

} // namespace dashwire::protocol
