#pragma once

#include <string>
#include <string_view>

#include "rarity/core/errors.hpp"
#include "rarity/core/models.hpp"

namespace rarity::codec {

// {"name", "rank", "total", "score", "traits": {type: {"type","name","tier","percentage"}}}
// This is both the HTTP response body and the cached value.
[[nodiscard]] rarity::core::Status item_to_json(const rarity::core::Item& item, std::string* out) noexcept;

// Codec/Malformed when text is not JSON or lacks a required field.
[[nodiscard]] rarity::core::Status item_from_json(std::string_view text, rarity::core::Item* out) noexcept;

} // namespace rarity::codec
