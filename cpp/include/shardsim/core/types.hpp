#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace shardsim::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i32 = std::int32_t;
    using i64 = std::int64_t;

    // Nanoseconds since the Unix epoch.
    using Timestamp = i64;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    using ShardIndex = u32;

    struct ObjectId {
        u32 worker{0};
        u32 run{0};
        friend constexpr bool operator==(ObjectId, ObjectId) noexcept = default;
    };

    static_assert(std::is_trivially_copyable_v<Hash256>);
    static_assert(std::is_trivially_copyable_v<ObjectId>);
    static_assert(std::is_standard_layout_v<ObjectId>);

} // namespace shardsim::core
