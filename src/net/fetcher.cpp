#include "rarity/net/fetcher.hpp"

#include <curl/curl.h>

#include <cstdio>
#include <memory>
#include <mutex>
#include <new>
#include <utility>

namespace rarity::net {

using namespace rarity::core;

namespace {
    std::once_flag g_curl_init;
    CURLcode g_curl_init_rc = CURLE_OK;

    constexpr const char* kDefaultUserAgent = "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 raritymon";

    struct Transfer {
        std::string* body{nullptr};
        u64 max_bytes{0};
        const std::atomic<bool>* cancel{nullptr};
        bool too_large{false};
    };

    size_t write_callback(char* contents, size_t size, size_t nmemb, void* userp) {
        Transfer* t = static_cast<Transfer*>(userp);
        const size_t n = size * nmemb;
        if (t->max_bytes > 0 && t->body->size() + n > t->max_bytes) {
            t->too_large = true;
            return 0;
        }
        try {
            t->body->append(contents, n);
        } catch (const std::bad_alloc&) {
            return 0;
        }
        return n;
    }

    int progress_callback(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        const Transfer* t = static_cast<const Transfer*>(userp);
        if (t->cancel != nullptr && t->cancel->load(std::memory_order_relaxed)) {
            return 1;
        }
        return 0;
    }

    [[nodiscard]] bool is_unreserved(unsigned char c) noexcept {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
               c == '-' || c == '_' || c == '.' || c == '~';
    }

    struct CurlFree {
        void operator()(CURL* c) const noexcept { curl_easy_cleanup(c); }
    };
} // namespace

CurlFetcher::CurlFetcher() noexcept : user_agent_(kDefaultUserAgent) {}

CurlFetcher::CurlFetcher(std::string user_agent) noexcept : user_agent_(std::move(user_agent)) {}

Status CurlFetcher::fetch(const std::string& url, const FetchOptions& opts, std::string* out) noexcept {
    if (out == nullptr || url.empty()) {
        return make_status(StatusDomain::Net, StatusCode::Invalid);
    }
    out->clear();

    std::call_once(g_curl_init, [] { g_curl_init_rc = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (g_curl_init_rc != CURLE_OK) {
        return make_status(StatusDomain::Net, StatusCode::Io, static_cast<u32>(g_curl_init_rc));
    }

    if (opts.cancel != nullptr && opts.cancel->load(std::memory_order_relaxed)) {
        return make_status(StatusDomain::Net, StatusCode::Cancelled);
    }

    std::unique_ptr<CURL, CurlFree> curl(curl_easy_init());
    if (!curl) {
        return make_status(StatusDomain::Net, StatusCode::Io, static_cast<u32>(CURLE_FAILED_INIT));
    }

    Transfer transfer{out, opts.max_body_bytes, opts.cancel, false};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(opts.timeout_ms));

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::fprintf(stderr, "[fetch] %s: %s\n", url.c_str(), curl_easy_strerror(res));
        out->clear();
        switch (res) {
            case CURLE_OPERATION_TIMEDOUT:
                return make_status(StatusDomain::Net, StatusCode::Timeout, static_cast<u32>(res));
            case CURLE_ABORTED_BY_CALLBACK:
                return make_status(StatusDomain::Net, StatusCode::Cancelled, static_cast<u32>(res));
            case CURLE_WRITE_ERROR:
                if (transfer.too_large) {
                    return make_status(StatusDomain::Net, StatusCode::Unsupported, static_cast<u32>(res));
                }
                return make_status(StatusDomain::Net, StatusCode::Io, static_cast<u32>(res));
            default:
                return make_status(StatusDomain::Net, StatusCode::Io, static_cast<u32>(res));
        }
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        out->clear();
        return make_status(StatusDomain::Net, StatusCode::Network, static_cast<u32>(http_code));
    }

    return ok_status();
}

std::string build_item_url(std::string_view host, std::string_view collection, u64 id) {
    static const char hex[] = "0123456789ABCDEF";

    std::string url = "https://";
    url.append(host);
    url += "/Item-details?collection=";
    for (char ch : collection) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            url.push_back(ch);
        } else {
            url.push_back('%');
            url.push_back(hex[(c >> 4) & 0xF]);
            url.push_back(hex[c & 0xF]);
        }
    }
    url += "&id=";
    url += std::to_string(id);
    return url;
}

} // namespace rarity::net
