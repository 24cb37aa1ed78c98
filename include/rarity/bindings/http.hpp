#pragma once

#include <atomic>
#include <string>
#include <string_view>

#include "rarity/core/errors.hpp"
#include "rarity/core/types.hpp"
#include "rarity/service/lookup.hpp"

namespace rarity::bindings::http {
    using u16 = rarity::core::u16;
    using u32 = rarity::core::u32;
    using u64 = rarity::core::u64;

    struct HttpRequest {
        std::string_view method{};
        std::string_view path{};   // may include a query string
    };

    struct HttpResponse {
        u16 status{500};
        std::string content_type{"text/plain; charset=utf-8"};
        std::string body{};
    };

    // Routes:
    //   GET     /api/{collection}/{id}   200 item JSON, 400 bad id, 500 lookup failure
    //   OPTIONS *                        204 (CORS preflight)
    // Anything else is 404 (unknown path) or 405 (known path, wrong method).
    // The returned Status is the lookup's, or Bindings/Invalid for a rejected request;
    // *out is always filled in.
    rarity::core::Status handle_http_request(rarity::service::ItemLookup& lookup,
                                             const HttpRequest& req,
                                             HttpResponse* out,
                                             const std::atomic<bool>* cancel = nullptr) noexcept;

    // Strict non-negative decimal; rejects signs, spaces and overflow.
    [[nodiscard]] bool parse_item_id(std::string_view text, u64* out) noexcept;

    [[nodiscard]] const char* reason_phrase(u16 status) noexcept;

} // namespace rarity::bindings::http
