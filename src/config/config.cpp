#include "rarity/config/config.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <utility>
#include <new>

namespace rarity::config {

using namespace rarity::core;

namespace {
    template <typename T>
    [[nodiscard]] bool parse_number(const char* s, T* out) noexcept {
        if (s == nullptr || *s == '\0') {
            return false;
        }
        const char* end = s + std::strlen(s);
        T v{};
        const auto r = std::from_chars(s, end, v, 10);
        if (r.ec != std::errc() || r.ptr != end) {
            return false;
        }
        *out = v;
        return true;
    }
} // namespace

std::string getenv_or_default(const char* key, const char* def) {
    const char* val = std::getenv(key);
    if (val == nullptr) {
        return def;
    }
    return val;
}

Status load_from_env(AppConfig* cfg) noexcept {
    if (cfg == nullptr) {
        return make_status(StatusDomain::Config, StatusCode::Invalid);
    }

    try {
        AppConfig next = *cfg;

        next.db_path = getenv_or_default(kEnvDbPath, cfg->db_path.c_str());
        next.listen_address = getenv_or_default(kEnvListen, cfg->listen_address.c_str());
        next.source_host = getenv_or_default(kEnvSourceHost, cfg->source_host.c_str());

        if (const char* v = std::getenv(kEnvFetchTimeout)) {
            if (!parse_number(v, &next.fetch_timeout_ms)) {
                return make_status(StatusDomain::Config, StatusCode::Invalid, 3);
            }
        }
        if (const char* v = std::getenv(kEnvCacheMaxAge)) {
            if (!parse_number(v, &next.cache_max_age_s) || next.cache_max_age_s < 0) {
                return make_status(StatusDomain::Config, StatusCode::Invalid, 4);
            }
        }

        *cfg = std::move(next);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Config, StatusCode::Unknown);
    }
    return ok_status();
}

} // namespace rarity::config
