#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>

namespace openflow::menukit {

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using size_t = std::size_t;
using usize = std::size_t;

using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

// Host element handle. Zero never names a live element.
using ElementId = u64;
constexpr ElementId INVALID_ELEMENT = 0;

using TaskId = u64;
constexpr TaskId INVALID_TASK = 0;

using ListenerId = u64;
constexpr ListenerId INVALID_LISTENER = 0;

// Incremented on every open/close edge of a controller.
using SessionToken = u64;

// "Nothing highlighted" sentinel for roving focus indices.
constexpr i32 NO_HIGHLIGHT = -1;

struct Rect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    constexpr bool contains(double px, double py) const {
        return px >= x && py >= y && px < x + width && py < y + height;
    }
};

}  // namespace openflow::menukit
