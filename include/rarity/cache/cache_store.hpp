#pragma once

#include <mutex>
#include <string>
#include <string_view>

#include "rarity/cache/fingerprint.hpp"
#include "rarity/core/errors.hpp"
#include "rarity/core/types.hpp"

struct sqlite3;

namespace rarity::cache {

using Timestamp = rarity::core::Timestamp;

inline constexpr const char* kCacheNamespace = "RarityCache";

struct CacheConfig {
    std::string path{":memory:"};   // SQLite database file
    rarity::core::i64 max_age_seconds{0}; // 0 = entries never expire
    Timestamp (*clock)() noexcept = nullptr; // seconds since epoch; nullptr = std::time
};

// Fingerprint -> serialized Item, persisted in one SQLite table named
// kCacheNamespace. Each get/put is a single statement, so readers never see a
// half-written value; there is no multi-statement transaction.
class CacheStore {
public:
    CacheStore() noexcept;
    ~CacheStore() noexcept;

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    [[nodiscard]] rarity::core::Status open(const CacheConfig& cfg) noexcept;
    rarity::core::Status close() noexcept;
    [[nodiscard]] bool is_open() const noexcept;

    // ========================================================================
    // Entries
    // ========================================================================

    // A miss (absent, or older than max_age_seconds) is Ok with *found = false.
    [[nodiscard]] rarity::core::Status get(const Fingerprint& key, std::string* out, bool* found) noexcept;

    // Unconditional upsert. Creates the namespace on first use.
    [[nodiscard]] rarity::core::Status put(const Fingerprint& key, std::string_view value) noexcept;

    // Entries currently stored, expired ones included.
    [[nodiscard]] rarity::core::Status count(rarity::core::u64* out) noexcept;

private:
    [[nodiscard]] rarity::core::Status namespace_exists_locked(bool* exists) noexcept;
    [[nodiscard]] rarity::core::Status ensure_namespace_locked() noexcept;
    [[nodiscard]] Timestamp now() const noexcept;

    sqlite3* db_{nullptr};
    CacheConfig cfg_{};
    bool namespace_ready_{false};
    mutable std::mutex mutex_;
};

} // namespace rarity::cache
