#pragma once

#include <string>
#include <string_view>

#include "rarity/core/errors.hpp"
#include "rarity/core/types.hpp"

namespace rarity::cache {
    using u8 = rarity::core::u8;
    using u32 = rarity::core::u32;
    using u64 = rarity::core::u64;

    using Fingerprint = rarity::core::Hash256;

    // BLAKE3 of "<collection>:<id>", the cache key for one item.
    rarity::core::Status fingerprint(std::string_view collection, u64 id, Fingerprint* out) noexcept;

    // Lowercase hex, 64 characters.
    [[nodiscard]] std::string fingerprint_hex(const Fingerprint& f);

} // namespace rarity::cache
