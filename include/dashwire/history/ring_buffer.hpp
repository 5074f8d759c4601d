#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>


namespace dashwire {
namespace history {

//------------------------------------------------------------------------------
// Single-threaded overwrite-on-full circular buffer.
//
// A fixed-capacity history: once full, every add() evicts the oldest element
// and hands it back to the caller, so owners that maintain derived aggregates
// (per-type counters, indexes) can keep them consistent.
//
// Characteristics:
//   • O(1) add, peek and size
//   • Capacity chosen at construction, storage allocated once
//   • Dense slot array with head (next write) / tail (oldest) / count
//
// Ordering:
//   • get_all(), get_oldest(), to_array(), for_each(), map()  → oldest first
//   • get_recent(), find_last()                              → newest first
//
// Thread-safety:
//   - NOT thread-safe. Must only be used from a single thread.
//
// Example:
//   RingBuffer<int> ring(3);
//   ring.add(1); ring.add(2); ring.add(3);
//   auto evicted = ring.add(4);   // evicted == 1
//   ring.get_recent(2);           // {4, 3}
//------------------------------------------------------------------------------
template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(std::size_t capacity)
        : capacity_(capacity)
    {
        if (capacity_ == 0) {
            throw std::invalid_argument("RingBuffer capacity must be at least 1");
        }
        slots_.resize(capacity_);
    }

    // Appends an item. Returns the evicted oldest item when the buffer was full.
    std::optional<T> add(T item) {
        std::optional<T> evicted;
        if (count_ == capacity_) {
            evicted.emplace(std::move(slots_[head_]));
            tail_ = next_(tail_);
        } else {
            ++count_;
        }
        slots_[head_] = std::move(item);
        head_ = next_(head_);
        return evicted;
    }

    // Appends items in order. Returns every evicted item, oldest first.
    std::vector<T> add_batch(std::vector<T> items) {
        std::vector<T> evicted;
        for (auto& item : items) {
            if (auto old = add(std::move(item))) {
                evicted.push_back(std::move(*old));
            }
        }
        return evicted;
    }

    // Oldest first
    [[nodiscard]]
    std::vector<T> get_all() const {
        std::vector<T> out;
        out.reserve(count_);
        for (std::size_t i = 0; i < count_; ++i) {
            out.push_back(at_(i));
        }
        return out;
    }

    [[nodiscard]]
    std::vector<T> to_array() const { return get_all(); }

    // Up to `k` newest items, newest first
    [[nodiscard]]
    std::vector<T> get_recent(std::size_t k) const {
        const std::size_t n = (k < count_) ? k : count_;
        std::vector<T> out;
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            out.push_back(at_(count_ - 1 - i));
        }
        return out;
    }

    // Up to `k` oldest items, oldest first
    [[nodiscard]]
    std::vector<T> get_oldest(std::size_t k) const {
        const std::size_t n = (k < count_) ? k : count_;
        std::vector<T> out;
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            out.push_back(at_(i));
        }
        return out;
    }

    [[nodiscard]]
    std::optional<T> peek_newest() const {
        if (count_ == 0) return std::nullopt;
        return at_(count_ - 1);
    }

    [[nodiscard]]
    std::optional<T> peek_oldest() const {
        if (count_ == 0) return std::nullopt;
        return at_(0);
    }

    // Every item satisfying `pred`, oldest first
    template <typename Pred>
    [[nodiscard]]
    std::vector<T> find(Pred&& pred) const {
        std::vector<T> out;
        for (std::size_t i = 0; i < count_; ++i) {
            const T& item = at_(i);
            if (pred(item)) {
                out.push_back(item);
            }
        }
        return out;
    }

    // Oldest item satisfying `pred`
    template <typename Pred>
    [[nodiscard]]
    std::optional<T> find_first(Pred&& pred) const {
        for (std::size_t i = 0; i < count_; ++i) {
            const T& item = at_(i);
            if (pred(item)) {
                return item;
            }
        }
        return std::nullopt;
    }

    // Newest item satisfying `pred`
    template <typename Pred>
    [[nodiscard]]
    std::optional<T> find_last(Pred&& pred) const {
        for (std::size_t i = count_; i > 0; --i) {
            const T& item = at_(i - 1);
            if (pred(item)) {
                return item;
            }
        }
        return std::nullopt;
    }

    // fn(item, index), oldest first
    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (std::size_t i = 0; i < count_; ++i) {
            fn(at_(i), i);
        }
    }

    // fn(item, index) -> U, oldest first
    template <typename Fn>
    [[nodiscard]]
    auto map(Fn&& fn) const {
        using U = std::decay_t<decltype(fn(std::declval<const T&>(), std::size_t{}))>;
        std::vector<U> out;
        out.reserve(count_);
        for (std::size_t i = 0; i < count_; ++i) {
            out.push_back(fn(at_(i), i));
        }
        return out;
    }

    void clear() {
        for (auto& slot : slots_) {
            slot = T{};
        }
        head_ = tail_ = count_ = 0;
    }

    [[nodiscard]] inline std::size_t size() const noexcept { return count_; }
    [[nodiscard]] inline std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] inline bool empty() const noexcept { return count_ == 0; }
    [[nodiscard]] inline bool full() const noexcept { return count_ == capacity_; }

private:
    // i-th element counting from the oldest
    inline const T& at_(std::size_t i) const noexcept {
        return slots_[(tail_ + i) % capacity_];
    }

    inline std::size_t next_(std::size_t idx) const noexcept {
        return (idx + 1 == capacity_) ? 0 : idx + 1;
    }

private:
    std::size_t capacity_;
    std::vector<T> slots_;
    std::size_t head_{0};    // next write slot
    std::size_t tail_{0};    // oldest element
    std::size_t count_{0};
};

} // namespace history
} // namespace dashwire
