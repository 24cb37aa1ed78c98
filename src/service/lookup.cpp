#include "rarity/service/lookup.hpp"

#include <cstdio>
#include <utility>

#include "rarity/codec/item_json.hpp"

namespace rarity::service {

using namespace rarity::core;

namespace {
    void log_failure(const char* stage, std::string_view collection, u64 id, Status s) {
        char desc[160];
        std::fprintf(stderr, "[lookup] %.*s:%llu %s failed: %s\n",
                     static_cast<int>(collection.size()), collection.data(),
                     static_cast<unsigned long long>(id), stage,
                     status_describe(s, desc, sizeof(desc)));
    }

    [[nodiscard]] bool cancelled(const std::atomic<bool>* cancel) noexcept {
        return cancel != nullptr && cancel->load(std::memory_order_relaxed);
    }
} // namespace

ItemLookup::ItemLookup(rarity::cache::CacheStore& store, rarity::net::PageFetcher& fetcher, LookupConfig cfg)
    : store_(store), fetcher_(fetcher), cfg_(std::move(cfg)) {}

Status ItemLookup::lookup(std::string_view collection, u64 id, LookupResult* out,
                          const std::atomic<bool>* cancel) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Core, StatusCode::Invalid);
    }

    rarity::cache::Fingerprint key{};
    Status s = rarity::cache::fingerprint(collection, id, &key);
    if (!is_ok(s)) {
        return s;
    }

    std::string cached;
    bool found = false;
    s = store_.get(key, &cached, &found);
    if (!is_ok(s)) {
        log_failure("cache read", collection, id, s);
        return s;
    }
    if (found) {
        if (cfg_.verbose) {
            std::fprintf(stderr, "[lookup] %.*s:%llu cache hit\n",
                         static_cast<int>(collection.size()), collection.data(),
                         static_cast<unsigned long long>(id));
        }
        out->json = std::move(cached);
        out->source = LookupSource::Cache;
        out->key = key;
        return ok_status();
    }

    if (cfg_.verbose) {
        std::fprintf(stderr, "[lookup] %.*s:%llu cache miss, fetching\n",
                     static_cast<int>(collection.size()), collection.data(),
                     static_cast<unsigned long long>(id));
    }

    std::string page;
    rarity::net::FetchOptions opts{};
    opts.timeout_ms = cfg_.fetch_timeout_ms;
    opts.cancel = cancel;
    s = fetcher_.fetch(rarity::net::build_item_url(cfg_.source_host, collection, id), opts, &page);
    if (!is_ok(s)) {
        log_failure("fetch", collection, id, s);
        return s;
    }

    Item item;
    s = rarity::extract::extract_item(page, cfg_.layout, &item);
    if (!is_ok(s)) {
        log_failure("extract", collection, id, s);
        return s;
    }

    std::string json;
    s = rarity::codec::item_to_json(item, &json);
    if (!is_ok(s)) {
        log_failure("encode", collection, id, s);
        return s;
    }

    // The caller went away; leave the cache untouched.
    if (cancelled(cancel)) {
        return make_status(StatusDomain::Net, StatusCode::Cancelled);
    }

    s = store_.put(key, json);
    if (!is_ok(s)) {
        log_failure("cache write", collection, id, s);
        return s;
    }

    out->json = std::move(json);
    out->source = LookupSource::Fetched;
    out->key = key;
    return ok_status();
}

} // namespace rarity::service
