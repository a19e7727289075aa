#pragma once

#include <cstdint>
#include <cstddef>

namespace sloup::core{

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    using Timestamp = i64;

    // Swift sizes are expressed in MiB throughout (segment size, disk budget).
    inline constexpr u64 kMiB = 1048576;

    inline constexpr u64 kDefaultSegmentSize = kMiB;
    inline constexpr u64 kMinSegmentSize = kMiB;
    inline constexpr u32 kDefaultMaxSegments = 1000;
    inline constexpr u32 kDefaultConcurrency = 10;

    // Bytes moved per read/write while materializing a segment.
    inline constexpr u64 kCopyChunkBytes = kMiB;

    // ceil(a / b) without the (a + b - 1) overflow; b must be non-zero.
    [[nodiscard]] constexpr u64 ceil_div(u64 a, u64 b) noexcept {
        return a / b + (a % b != 0 ? 1 : 0);
    }

} // namespace sloup::core
