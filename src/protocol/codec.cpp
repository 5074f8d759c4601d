#include "dashwire/protocol/codec.hpp"

#include "dashwire/log/logger.hpp"

namespace dashwire::protocol {

RawFrame make_raw(std::string_view text) {
    RawFrame frame;
    frame.type = std::string(frame_type::Raw);
    frame.payload = json::quote(text);
    return frame;
}

bool Codec::decode(std::string_view text, RawFrame& out) {
    out = RawFrame{};

    simdjson::dom::element root;
    auto error = parser_.parse(text.data(), text.size()).get(root);
    if (error) {
        DW_DEBUG("[CODEC] Malformed frame (" << simdjson::error_message(error) << "), downgraded to raw");
        out = make_raw(text);
        return false;
    }

    simdjson::dom::object obj;
    if (root.get_object().get(obj)) {
        DW_DEBUG("[CODEC] Non-object frame downgraded to raw");
        out = make_raw(text);
        return false;
    }

    std::string_view type;
    if (obj["type"].get_string().get(type)) {
        DW_DEBUG("[CODEC] Frame without string 'type' downgraded to raw");
        out = make_raw(text);
        return false;
    }
    out.type = std::string(type);

    // channel (optional, string or null)
    std::string_view channel;
    if (!obj["channel"].get_string().get(channel)) {
        out.channel = std::string(channel);
    }

    // payload (optional, any JSON value kept verbatim)
    simdjson::dom::element payload;
    if (!obj["payload"].get(payload)) {
        out.payload = simdjson::minify(payload);
    }

    // timestamp (optional, number)
    simdjson::dom::element ts;
    if (!obj["timestamp"].get(ts) && ts.is_number()) {
        double value = 0.0;
        if (!ts.get_double().get(value)) {
            out.timestamp = value;
        }
    }

    return true;
}

} // namespace dashwire::protocol
