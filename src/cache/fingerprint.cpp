#include "rarity/cache/fingerprint.hpp"

#include <cstddef>
#include <cstdio>

#include <blake3.h>

namespace rarity::cache {
    rarity::core::Status fingerprint(std::string_view collection, u64 id, Fingerprint* out) noexcept {
        if (out == nullptr){
            return rarity::core::make_status(rarity::core::StatusDomain::Cache, rarity::core::StatusCode::Invalid);
        }

        char id_buf[24];
        const int n = std::snprintf(id_buf, sizeof(id_buf), "%llu", static_cast<unsigned long long>(id));

        const u8 sep = ':';
        blake3_hasher hasher;
        blake3_hasher_init(&hasher);
        blake3_hasher_update(&hasher, collection.data(), collection.size());
        blake3_hasher_update(&hasher, &sep, 1);
        blake3_hasher_update(&hasher, id_buf, static_cast<size_t>(n));
        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return rarity::core::ok_status();
    }

    std::string fingerprint_hex(const Fingerprint& f) {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(f.b.size() * 2);
        for (u8 b : f.b) {
            out.push_back(hex[(b >> 4) & 0xF]);
            out.push_back(hex[b & 0xF]);
        }
        return out;
    }
} // namespace rarity::cache
