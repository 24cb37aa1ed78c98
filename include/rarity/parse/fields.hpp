#pragma once

#include <string>
#include <string_view>

#include "rarity/core/errors.hpp"
#include "rarity/core/types.hpp"

namespace rarity::parse {
    using i64 = rarity::core::i64;

    struct RankInfo {
        i64 rank{rarity::core::kMissingNumber};
        i64 total{rarity::core::kMissingNumber};
    };

    struct TraitEntry {
        std::string type;
        std::string value;
    };

    // The parsers below never fail. A label that does not match yields the sentinel
    // (-1 for numbers, empty strings for trait entries).

    // "Rank <N> / <M>" anywhere in the trimmed text.
    [[nodiscard]] RankInfo parse_rank(std::string_view text) noexcept;

    // "Rarity Score: <float>" anywhere in the trimmed text.
    [[nodiscard]] double parse_rarity_score(std::string_view text) noexcept;

    // "<key>: <value>" where both sides are word characters, spaces, '_' or '-'.
    [[nodiscard]] TraitEntry parse_trait_entry(std::string_view text) noexcept;

    // Strips '%' signs and surrounding whitespace, then parses a non-negative float.
    // Unlike the label parsers this one reports Parse/Malformed: a bad percentage
    // would otherwise read as a legitimate 0%.
    [[nodiscard]] rarity::core::Status parse_percentage(std::string_view text, double* out) noexcept;

    [[nodiscard]] std::string_view trim(std::string_view text) noexcept;

} // namespace rarity::parse
