#pragma once

#include <atomic>
#include <string>
#include <string_view>

#include "rarity/cache/cache_store.hpp"
#include "rarity/cache/fingerprint.hpp"
#include "rarity/core/errors.hpp"
#include "rarity/extract/pipeline.hpp"
#include "rarity/net/fetcher.hpp"

namespace rarity::service {
    using u8 = rarity::core::u8;
    using u32 = rarity::core::u32;
    using u64 = rarity::core::u64;

    struct LookupConfig {
        std::string source_host{rarity::net::kDefaultSourceHost};
        u32 fetch_timeout_ms{10000};
        bool verbose{false};
        rarity::extract::PageLayout layout{};
    };

    enum class LookupSource : u8 {
        Cache = 0,
        Fetched = 1,
    };

    struct LookupResult {
        std::string json;
        LookupSource source{LookupSource::Cache};
        rarity::cache::Fingerprint key{};
    };

    // Read-through cache in front of fetch + extract. Within one call the order
    // is always: cache read, fetch, cache write. Nothing is written unless a
    // complete Item was extracted and serialized.
    //
    // The store and fetcher are borrowed and must outlive the lookup. lookup() is
    // safe to call from several request threads at once; two concurrent misses
    // for the same item both fetch and the later write wins.
    class ItemLookup {
    public:
        ItemLookup(rarity::cache::CacheStore& store, rarity::net::PageFetcher& fetcher, LookupConfig cfg);

        [[nodiscard]] rarity::core::Status lookup(std::string_view collection,
                                                  u64 id,
                                                  LookupResult* out,
                                                  const std::atomic<bool>* cancel = nullptr) noexcept;

        [[nodiscard]] const LookupConfig& config() const noexcept { return cfg_; }

    private:
        rarity::cache::CacheStore& store_;
        rarity::net::PageFetcher& fetcher_;
        LookupConfig cfg_;
    };

} // namespace rarity::service
