#pragma once

#include <string_view>

#include "rarity/core/errors.hpp"
#include "rarity/core/models.hpp"
#include "rarity/html/document.hpp"

namespace rarity::extract {

// Where each field lives on an item-details page.
struct PageLayout {
    rarity::html::Selector name{"h2", nullptr, nullptr};
    rarity::html::Selector rank{"button", "class", "item-rarity-rank"};
    rarity::html::Selector score{"button", "class", "item-trait-data"};
    rarity::html::Selector trait_titles{"h3", "class", "tier-title"};
    rarity::html::Selector trait_percentages{"div", "class", "item-rarity-percentage"};
    rarity::html::Selector trait_tiers{"div", "class", "item-rarity-tier"};
};

[[nodiscard]] const PageLayout& default_layout() noexcept;

// Builds a complete Item from one page, or nothing at all.
//  - Html/Malformed   the page did not parse
//  - Html/NotFound    a required node (or its text) is missing
//  - Extract/Unbalanced  title/percentage/tier counts differ
//  - Parse/Malformed  a trait percentage is not a number
// *out is only written on success.
[[nodiscard]] rarity::core::Status extract_item(std::string_view raw_html,
                                                rarity::core::Item* out) noexcept;

[[nodiscard]] rarity::core::Status extract_item(std::string_view raw_html,
                                                const PageLayout& layout,
                                                rarity::core::Item* out) noexcept;

// Same, over an already parsed document.
[[nodiscard]] rarity::core::Status extract_item(const rarity::html::Document& doc,
                                                const PageLayout& layout,
                                                rarity::core::Item* out) noexcept;

} // namespace rarity::extract
