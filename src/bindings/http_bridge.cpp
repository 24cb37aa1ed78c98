#include "rarity/bindings/http.hpp"

#include <charconv>
#include <cstring>
#include <new>
#include <string>
#include <utility>

namespace rarity::bindings::http {

using namespace rarity::core;

namespace {
    // Expected format:
    // GET /api/{collection}/{id}
    struct ParsedPath {
        std::string collection;
        std::string_view id;
    };

    enum class PathMatch { Ok, NotFound, BadEncoding };

    [[nodiscard]] int hex_value(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    [[nodiscard]] bool percent_decode(std::string_view in, std::string* out) {
        out->clear();
        out->reserve(in.size());
        for (size_t i = 0; i < in.size(); ++i) {
            if (in[i] != '%') {
                out->push_back(in[i]);
                continue;
            }
            if (i + 2 >= in.size()) {
                return false;
            }
            const int hi = hex_value(in[i + 1]);
            const int lo = hex_value(in[i + 2]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            out->push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        }
        return true;
    }

    [[nodiscard]] PathMatch parse_path(std::string_view path, ParsedPath* out) {
        const size_t q = path.find('?');
        if (q != std::string_view::npos) {
            path = path.substr(0, q);
        }

        constexpr std::string_view kPrefix = "/api/";
        if (path.substr(0, kPrefix.size()) != kPrefix) {
            return PathMatch::NotFound;
        }
        path.remove_prefix(kPrefix.size());

        const size_t slash = path.find('/');
        if (slash == std::string_view::npos || slash == 0) {
            return PathMatch::NotFound;
        }
        const std::string_view collection = path.substr(0, slash);
        std::string_view id = path.substr(slash + 1);
        if (id.empty() || id.find('/') != std::string_view::npos) {
            return PathMatch::NotFound;
        }

        if (!percent_decode(collection, &out->collection)) {
            return PathMatch::BadEncoding;
        }
        out->id = id;
        return PathMatch::Ok;
    }

    void set_text(HttpResponse* out, u16 status, std::string_view body) {
        out->status = status;
        out->content_type = "text/plain; charset=utf-8";
        out->body.assign(body);
    }

    Status handle_get_item(rarity::service::ItemLookup& lookup, const ParsedPath& path,
                           HttpResponse* out, const std::atomic<bool>* cancel) {
        u64 id = 0;
        if (!parse_item_id(path.id, &id)) {
            std::string msg = "invalid item id: ";
            msg.append(path.id);
            set_text(out, 400, msg);
            return make_status(StatusDomain::Bindings, StatusCode::Invalid);
        }

        rarity::service::LookupResult result;
        const Status s = lookup.lookup(path.collection, id, &result, cancel);
        if (!is_ok(s)) {
            char desc[160];
            set_text(out, 500, status_describe(s, desc, sizeof(desc)));
            return s;
        }

        out->status = 200;
        out->content_type = "application/json; charset=utf-8";
        out->body = std::move(result.json);
        return ok_status();
    }
} // namespace

bool parse_item_id(std::string_view text, u64* out) noexcept {
    if (out == nullptr || text.empty()) {
        return false;
    }
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    if (*begin < '0' || *begin > '9') {
        return false;
    }
    u64 v = 0;
    const auto r = std::from_chars(begin, end, v, 10);
    if (r.ec != std::errc() || r.ptr != end) {
        return false;
    }
    *out = v;
    return true;
}

const char* reason_phrase(u16 status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

// Main HTTP request handler
Status handle_http_request(rarity::service::ItemLookup& lookup, const HttpRequest& req,
                           HttpResponse* out, const std::atomic<bool>* cancel) noexcept {
    if (!out) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }

    try {
        // Initialize response
        set_text(out, 500, "");

        if (req.method == "OPTIONS") {
            out->status = 204;
            return ok_status();
        }

        ParsedPath path;
        const PathMatch match = parse_path(req.path, &path);
        if (match == PathMatch::NotFound) {
            set_text(out, 404, "not found");
            return make_status(StatusDomain::Bindings, StatusCode::NotFound);
        }
        if (match == PathMatch::BadEncoding) {
            set_text(out, 400, "invalid collection encoding");
            return make_status(StatusDomain::Bindings, StatusCode::Invalid);
        }

        if (req.method != "GET" && req.method != "HEAD") {
            set_text(out, 405, "method not allowed");
            return make_status(StatusDomain::Bindings, StatusCode::Unsupported);
        }

        return handle_get_item(lookup, path, out, cancel);
    } catch (const std::bad_alloc&) {
        out->status = 500;
        out->body.clear();
        return make_status(StatusDomain::Bindings, StatusCode::Unknown);
    }
}

} // namespace rarity::bindings::http
