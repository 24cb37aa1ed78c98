#pragma once

#include <atomic>
#include <string>
#include <string_view>

#include "rarity/core/errors.hpp"
#include "rarity/core/types.hpp"

namespace rarity::net {
    using u32 = rarity::core::u32;
    using u64 = rarity::core::u64;

    inline constexpr const char* kDefaultSourceHost = "www.raritymon.com";

    struct FetchOptions {
        u32 timeout_ms{10000};                    // whole transfer; 0 = no limit
        u64 max_body_bytes{8u * 1024u * 1024u};
        const std::atomic<bool>* cancel{nullptr}; // polled during the transfer
    };

    // Retrieves raw page text. Every failure is reported in the Net domain:
    //  - Net/Network    non-200 response (aux = HTTP status)
    //  - Net/Timeout    timeout_ms elapsed
    //  - Net/Cancelled  *cancel became true
    //  - Net/Io         transport error (aux = library error code)
    class PageFetcher {
    public:
        virtual ~PageFetcher() = default;

        [[nodiscard]] virtual rarity::core::Status fetch(const std::string& url,
                                                         const FetchOptions& opts,
                                                         std::string* out) noexcept = 0;
    };

    class CurlFetcher final : public PageFetcher {
    public:
        CurlFetcher() noexcept;
        explicit CurlFetcher(std::string user_agent) noexcept;

        [[nodiscard]] rarity::core::Status fetch(const std::string& url,
                                                 const FetchOptions& opts,
                                                 std::string* out) noexcept override;

    private:
        std::string user_agent_;
    };

    // https://<host>/Item-details?collection=<collection>&id=<id>, with the
    // collection percent-encoded.
    [[nodiscard]] std::string build_item_url(std::string_view host, std::string_view collection, u64 id);

} // namespace rarity::net
