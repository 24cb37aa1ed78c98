#pragma once

#include <string>

#include "rarity/core/errors.hpp"
#include "rarity/core/types.hpp"

namespace rarity::config {
    using u32 = rarity::core::u32;
    using i64 = rarity::core::i64;

    struct AppConfig {
        std::string db_path{"raritymon.db"};
        std::string listen_address{":1337"};
        std::string source_host{"www.raritymon.com"};
        u32 fetch_timeout_ms{10000};
        i64 cache_max_age_s{0};   // 0 = cache entries never expire
        bool verbose{false};
    };

    // Environment variables read by load_from_env.
    inline constexpr const char* kEnvDbPath = "RARITYMON_DB_PATH";
    inline constexpr const char* kEnvListen = "RARITYMON_WEB_HOST";
    inline constexpr const char* kEnvSourceHost = "RARITYMON_SOURCE_HOST";
    inline constexpr const char* kEnvFetchTimeout = "RARITYMON_FETCH_TIMEOUT_MS";
    inline constexpr const char* kEnvCacheMaxAge = "RARITYMON_CACHE_MAX_AGE";

    // Value of key, or def when unset. An empty value counts as set.
    [[nodiscard]] std::string getenv_or_default(const char* key, const char* def);

    // Starts from *cfg and overrides each field whose variable is set.
    // Config/Invalid (aux = offending variable's index in the list above) when a
    // numeric variable does not parse; *cfg is left untouched in that case.
    [[nodiscard]] rarity::core::Status load_from_env(AppConfig* cfg) noexcept;

} // namespace rarity::config
