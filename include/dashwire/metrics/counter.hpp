#pragma once

#include <type_traits>
#include <cstdint>

namespace dashwire {
namespace metrics {

// ---------------------------------------------------------------------------
// counter - A simple monotonically increasing counter (Cumulative metric)
// ---------------------------------------------------------------------------
//
// No multithreading guarantees. Owned and updated by the polling thread only.
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct counter {
public:
    constexpr counter() noexcept = default;
    constexpr explicit counter(T initial) noexcept : value_(initial) {}

    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    // Accessor
    inline constexpr T load() const noexcept { return value_; }
    // Mutators
    inline constexpr void inc(T n = 1) noexcept { value_ += n; }
    inline constexpr void reset() noexcept { value_ = 0; }

private:
    T value_{0};
};

using counter32 = counter<uint32_t>;
static_assert(std::is_standard_layout_v<counter32>, "counter32 must be standard layout");
using counter64 = counter<uint64_t>;
static_assert(std::is_standard_layout_v<counter64>, "counter64 must be standard layout");

} // namespace metrics
} // namespace dashwire
