/*
===============================================================================
subscription::Registry (Channel Intent Set)
===============================================================================

The Registry holds the set of channels the client wants to receive, whether
or not a socket is currently open.

It is the sole source of truth for resubscription: every time the transport
reaches the open state it sends one `subscribe` frame per channel, in
registration order.

-------------------------------------------------------------------------------
Key semantics
-------------------------------------------------------------------------------
• Insertion-ordered set, no duplicates
• Mutated regardless of connection state
• Survives disconnects and reconnects
• Order is stable: a re-added channel goes to the back

-------------------------------------------------------------------------------
What this class deliberately does NOT do
-------------------------------------------------------------------------------
• Does NOT send frames
• Does NOT track server acknowledgements
• Does NOT own channel handlers (the Router does)

-------------------------------------------------------------------------------
Threading & lifetime
-------------------------------------------------------------------------------
• Not thread-safe
• Owned by transport::Connection, mutated only from the polling thread
===============================================================================
*/

#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include "dashwire/log/logger.hpp"

namespace dashwire::subscription {

class Registry {
public:
    // Returns false if the channel was already registered
    bool add(const std::string& channel) {
        if (contains(channel)) {
            return false;
        }
        channels_.push_back(channel);
        DW_TRACE("[REGISTRY] Added channel {" << channel << "} (total=" << channels_.size() << ")");
        return true;
    }

    // Returns false if the channel was not registered
    bool remove(std::string_view channel) {
        auto it = std::find(channels_.begin(), channels_.end(), channel);
        if (it == channels_.end()) {
            return false;
        }
        channels_.erase(it);
        DW_TRACE("[REGISTRY] Removed channel {" << channel << "} (total=" << channels_.size() << ")");
        return true;
    }

    [[nodiscard]]
    bool contains(std::string_view channel) const noexcept {
        return std::find(channels_.begin(), channels_.end(), channel) != channels_.end();
    }

    void clear() noexcept { channels_.clear(); }

    [[nodiscard]] bool empty() const noexcept { return channels_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return channels_.size(); }

    // Registration order
    [[nodiscard]]
    const std::vector<std::string>& channels() const noexcept { return channels_; }

    // Visits every channel in registration order
    template<class Fn>
    void for_each(Fn&& fn) const {
        for (const auto& ch : channels_) {
            fn(ch);
        }
    }

private:
    std::vector<std::string> channels_;
};

} // namespace dashwire::subscription
