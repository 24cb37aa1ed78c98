#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace rarity::core{

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    using Timestamp = i64;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);
    static_assert(std::is_trivially_copyable_v<Hash256>);
    static_assert(std::is_standard_layout_v<Hash256>);

    // Sentinel stored in rank/total/score when the label text did not match.
    inline constexpr i64 kMissingNumber = -1;
    inline constexpr double kMissingScore = -1.0;

} // namespace rarity::core
