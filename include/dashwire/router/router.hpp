#pragma once

/*
===============================================================================
 router::Router
===============================================================================

Dispatches decoded frames to registered handlers.

Handlers are keyed by:

    "<type>"            exact frame type       on(type, h)
    "channel:<name>"    frame channel          on_channel(name, h)
    "*"                 every frame            on_all(h)

route(frame) invokes, in this order:

    1. handlers registered for frame.type, unless the type collides with a
       reserved key ("*" or "channel:...")
    2. handlers registered for frame.channel (if present)
    3. wildcard handlers

Within a key, handlers run in registration order. A handler that throws is
logged and counted; the remaining handlers still run and route() never throws.

Every registration returns an Unsubscribe closure removing exactly that
handler instance. When the last handler of a key goes away, the key itself is
erased. The closure holds only a weak reference to the handler table, so it
stays safe to call after the Router has been destroyed.
===============================================================================
*/

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "dashwire/core/listeners.hpp"
#include "dashwire/protocol/frame.hpp"
#include "dashwire/log/logger.hpp"

namespace dashwire::router {

inline constexpr std::string_view WildcardKey = "*";
inline constexpr std::string_view ChannelPrefix = "channel:";

[[nodiscard]]
inline std::string channel_key(std::string_view channel) {
    std::string key;
    key.reserve(ChannelPrefix.size() + channel.size());
    key += ChannelPrefix;
    key += channel;
    return key;
}

// Types that would alias the wildcard or a channel key
[[nodiscard]]
inline bool is_reserved_type(std::string_view type) noexcept {
    return type == WildcardKey || type.substr(0, ChannelPrefix.size()) == ChannelPrefix;
}

class Router {
public:
    using Handler = std::function<void(const protocol::RawFrame&)>;

    Router()
        : table_(std::make_shared<Table>())
    {}

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // Handlers for an exact frame type
    [[nodiscard]]
    Unsubscribe on(std::string_view type, Handler handler) {
        return add_(std::string(type), std::move(handler));
    }

    // Handlers for every frame tagged with `channel`
    [[nodiscard]]
    Unsubscribe on_channel(std::string_view channel, Handler handler) {
        return add_(channel_key(channel), std::move(handler));
    }

    // Handlers for every routed frame
    [[nodiscard]]
    Unsubscribe on_all(Handler handler) {
        return add_(std::string(WildcardKey), std::move(handler));
    }

    // Drops every handler registered for `channel`
    void remove_channel(std::string_view channel) {
        if (table_->handlers.erase(channel_key(channel)) > 0) {
            DW_TRACE("[ROUTER] Dropped handlers for channel {" << channel << "}");
        }
    }

    // Drops every handler
    void clear() noexcept {
        table_->handlers.clear();
    }

    void route(const protocol::RawFrame& frame) {
        ++routed_;
        if (!is_reserved_type(frame.type)) {
            dispatch_(frame.type, frame);
        }
        if (frame.channel) {
            dispatch_(channel_key(*frame.channel), frame);
        }
        dispatch_(WildcardKey, frame);
    }

    // Number of distinct handler keys
    [[nodiscard]]
    std::size_t key_count() const noexcept { return table_->handlers.size(); }

    // Number of handlers across all keys
    [[nodiscard]]
    std::size_t handler_count() const noexcept {
        std::size_t n = 0;
        for (const auto& [key, set] : table_->handlers) {
            n += set.size();
        }
        return n;
    }

    [[nodiscard]]
    bool has_handlers(std::string_view key) const {
        return table_->handlers.find(std::string(key)) != table_->handlers.end();
    }

    [[nodiscard]] std::uint64_t routed_count() const noexcept { return routed_; }
    [[nodiscard]] std::uint64_t fault_count() const noexcept { return faults_; }

private:
    using Set = core::ListenerSet<const protocol::RawFrame&>;

    struct Table {
        std::unordered_map<std::string, Set> handlers;
        std::uint64_t next_id{1};
    };

    Unsubscribe add_(std::string key, Handler handler) {
        // Ids are table-wide so a stale closure never matches a handler
        // registered after its key was erased and re-created
        const std::uint64_t id = table_->next_id++;
        table_->handlers[key].insert(id, std::move(handler));
        DW_TRACE("[ROUTER] Registered handler #" << id << " for {" << key << "}");
        std::weak_ptr<Table> weak = table_;
        return [weak, key = std::move(key), id]() {
            auto table = weak.lock();
            if (!table) {
                return;
            }
            auto it = table->handlers.find(key);
            if (it == table->handlers.end()) {
                return;
            }
            if (it->second.remove(id) && it->second.empty()) {
                table->handlers.erase(it);
            }
        };
    }

    void dispatch_(std::string_view key, const protocol::RawFrame& frame) {
        auto it = table_->handlers.find(std::string(key));
        if (it == table_->handlers.end()) {
            return;
        }
        // notify() iterates a snapshot, handlers may mutate the table while running
        faults_ += it->second.notify(key, frame);
    }

private:
    std::shared_ptr<Table> table_;
    std::uint64_t routed_{0};
    std::uint64_t faults_{0};
};

} // namespace dashwire::router
