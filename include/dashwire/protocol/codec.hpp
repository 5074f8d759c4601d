#pragma once

#include <string_view>

#include <simdjson.h>

#include "dashwire/protocol/frame.hpp"

namespace dashwire::protocol {

/*
===============================================================================
 protocol::Codec
===============================================================================

Decodes inbound text frames into RawFrame.

A frame is accepted as structured when it is a JSON object carrying a string
"type". Anything else (invalid JSON, arrays, scalars, objects without a string
"type") is downgraded to a synthetic frame:

    { "type": "raw", "payload": <original text as a JSON string> }

so malformed input is never lost and never fatal.

Owns a reusable simdjson DOM parser. Not thread-safe.
===============================================================================
*/
class Codec {
public:
    Codec() = default;

    Codec(const Codec&) = delete;
    Codec& operator=(const Codec&) = delete;

    // Returns true if the text decoded as a structured frame, false if it was
    // downgraded to a "raw" frame. `out` is always populated.
    bool decode(std::string_view text, RawFrame& out);

private:
    simdjson::dom::parser parser_;
};

// Builds the synthetic frame used for undecodable input
[[nodiscard]]
RawFrame make_raw(std::string_view text);

} // namespace dashwire::protocol
