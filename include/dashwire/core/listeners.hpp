#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <string_view>
#include <utility>
#include <vector>

#include "dashwire/log/logger.hpp"

namespace dashwire {

// Removes exactly the registration that produced it. Idempotent.
using Unsubscribe = std::function<void()>;

namespace core {

// ============================================================================
// ListenerSet
//
// Ordered set of callbacks with per-registration ids.
//
// notify() invokes every listener registered at the time of the call, in
// registration order. A listener that throws is logged and counted, and the
// remaining listeners still run. Listeners may add or remove registrations
// (including themselves) from inside a notification.
// ============================================================================
template<class... Args>
class ListenerSet {
public:
    using Fn = std::function<void(Args...)>;

    [[nodiscard]]
    std::uint64_t add(Fn fn) {
        const std::uint64_t id = next_id_++;
        entries_.push_back(Entry{id, std::move(fn)});
        return id;
    }

    // Registers under an id allocated by the owner (must be unique in this set)
    void insert(std::uint64_t id, Fn fn) {
        entries_.push_back(Entry{id, std::move(fn)});
    }

    bool remove(std::uint64_t id) noexcept {
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->id == id) {
                entries_.erase(it);
                return true;
            }
        }
        return false;
    }

    void clear() noexcept { entries_.clear(); }

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    // Returns the number of listeners that threw
    std::size_t notify(std::string_view scope, Args... args) const {
        if (entries_.empty()) [[likely]] {
            return 0;
        }
        const std::vector<Entry> snapshot = entries_;
        std::size_t faults = 0;
        for (const auto& e : snapshot) {
            try {
                e.fn(args...);
            }
            catch (const std::exception& ex) {
                ++faults;
                DW_ERROR("[HANDLER] {" << scope << "} handler #" << e.id << " threw: " << ex.what());
            }
            catch (...) {
                ++faults;
                DW_ERROR("[HANDLER] {" << scope << "} handler #" << e.id << " threw a non-standard exception");
            }
        }
        return faults;
    }

private:
    struct Entry {
        std::uint64_t id;
        Fn fn;
    };

    std::vector<Entry> entries_;
    std::uint64_t next_id_{1};
};

} // namespace core
} // namespace dashwire
