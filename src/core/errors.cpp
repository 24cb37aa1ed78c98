#include "rarity/core/errors.hpp"

#include <cstdio>

namespace rarity::core {

const char* status_code_name(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::Malformed: return "Malformed";
        case StatusCode::Unbalanced: return "Unbalanced";
        case StatusCode::Cancelled: return "Cancelled";
        case StatusCode::Timeout: return "Timeout";
        case StatusCode::Io: return "Io";
        case StatusCode::Network: return "Network";
        case StatusCode::Unsupported: return "Unsupported";
    }
    return "Unknown";
}

const char* status_domain_name(StatusDomain domain) noexcept {
    switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Parse: return "Parse";
        case StatusDomain::Html: return "Html";
        case StatusDomain::Extract: return "Extract";
        case StatusDomain::Cache: return "Cache";
        case StatusDomain::Codec: return "Codec";
        case StatusDomain::Net: return "Net";
        case StatusDomain::Cli: return "Cli";
        case StatusDomain::Bindings: return "Bindings";
        case StatusDomain::Config: return "Config";
    }
    return "Unknown";
}

const char* status_describe(Status s, char* buf, u32 buf_len) noexcept {
    if (buf == nullptr || buf_len == 0) {
        return "";
    }

    if (is_ok(s)) {
        std::snprintf(buf, buf_len, "ok");
    } else if (is_parse_failure(s)) {
        std::snprintf(buf, buf_len, "parse failure: source document did not parse or was empty");
    } else if (is_node_not_found(s)) {
        std::snprintf(buf, buf_len, "node not found: could not find the HTML node");
    } else if (is_unbalanced(s)) {
        std::snprintf(buf, buf_len, "unbalanced trait data: rarity nodes found are unbalanced");
    } else if (s.domain == StatusDomain::Parse && s.code == StatusCode::Malformed) {
        std::snprintf(buf, buf_len, "parse failure: malformed percentage value");
    } else if (is_fetch_failure(s)) {
        if (s.code == StatusCode::Network && s.aux >= 100 && s.aux < 600) {
            std::snprintf(buf, buf_len, "fetch failure: upstream returned HTTP %u", s.aux);
        } else {
            std::snprintf(buf, buf_len, "fetch failure: %s (aux=%u)", status_code_name(s.code), s.aux);
        }
    } else if (is_store_failure(s)) {
        std::snprintf(buf, buf_len, "store failure: %s (aux=%u)", status_code_name(s.code), s.aux);
    } else {
        std::snprintf(buf, buf_len, "%s error: %s (aux=%u)",
                      status_domain_name(s.domain), status_code_name(s.code), s.aux);
    }
    return buf;
}

} // namespace rarity::core
