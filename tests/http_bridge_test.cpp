#include <string>

#include <gtest/gtest.h>

#include "rarity/bindings/http.hpp"
#include "rarity/cache/cache_store.hpp"

using namespace rarity::core;
using rarity::bindings::http::HttpRequest;
using rarity::bindings::http::HttpResponse;
using rarity::bindings::http::handle_http_request;

namespace {

class StaticFetcher final : public rarity::net::PageFetcher {
public:
    Status fetch(const std::string& url, const rarity::net::FetchOptions&, std::string* out) noexcept override {
        ++calls;
        last_url = url;
        if (!is_ok(result)) {
            return result;
        }
        *out =
            "<html><body><h2>Item</h2>"
            "<button class=\"item-rarity-rank\">Rank 1 / 10</button>"
            "<button class=\"item-trait-data\">Rarity Score: 5</button>"
            "</body></html>";
        return ok_status();
    }

    Status result{};
    int calls{0};
    std::string last_url;
};

class HttpBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(is_ok(store_.open(rarity::cache::CacheConfig{})));
        cfg_.source_host = "source.test";
    }

    HttpResponse request(const char* method, const char* path) {
        rarity::service::ItemLookup lookup(store_, fetcher_, cfg_);
        HttpResponse resp;
        last_status_ = handle_http_request(lookup, HttpRequest{method, path}, &resp);
        return resp;
    }

    rarity::cache::CacheStore store_;
    StaticFetcher fetcher_;
    rarity::service::LookupConfig cfg_;
    Status last_status_{};
};

} // namespace

TEST_F(HttpBridgeTest, GetItemReturnsJson) {
    const HttpResponse resp = request("GET", "/api/cats/7");
    EXPECT_EQ(resp.status, 200);
    EXPECT_NE(resp.content_type.find("application/json"), std::string::npos);
    EXPECT_NE(resp.body.find("\"name\""), std::string::npos);
    EXPECT_TRUE(is_ok(last_status_));
    EXPECT_EQ(fetcher_.last_url, "https://source.test/Item-details?collection=cats&id=7");
}

TEST_F(HttpBridgeTest, RepeatedGetIsCached) {
    const HttpResponse a = request("GET", "/api/cats/7");
    const HttpResponse b = request("GET", "/api/cats/7");
    EXPECT_EQ(a.body, b.body);
    EXPECT_EQ(fetcher_.calls, 1);
}

TEST_F(HttpBridgeTest, QueryStringIsIgnored) {
    const HttpResponse resp = request("GET", "/api/cats/7?fresh=1");
    EXPECT_EQ(resp.status, 200);
}

TEST_F(HttpBridgeTest, CollectionIsPercentDecoded) {
    const HttpResponse resp = request("GET", "/api/cool%20cats/7");
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(fetcher_.last_url, "https://source.test/Item-details?collection=cool%20cats&id=7");
}

TEST_F(HttpBridgeTest, BadCollectionEncodingIsBadRequest) {
    const HttpResponse resp = request("GET", "/api/cats%zz/7");
    EXPECT_EQ(resp.status, 400);
    EXPECT_EQ(fetcher_.calls, 0);
}

TEST_F(HttpBridgeTest, NonNumericIdIsBadRequestWithoutLookup) {
    const HttpResponse resp = request("GET", "/api/cats/seven");
    EXPECT_EQ(resp.status, 400);
    EXPECT_EQ(resp.body, "invalid item id: seven");
    EXPECT_EQ(fetcher_.calls, 0);
    EXPECT_EQ(last_status_.domain, StatusDomain::Bindings);
}

TEST_F(HttpBridgeTest, NegativeIdIsBadRequest) {
    EXPECT_EQ(request("GET", "/api/cats/-1").status, 400);
    EXPECT_EQ(request("GET", "/api/cats/+1").status, 400);
    EXPECT_EQ(request("GET", "/api/cats/99999999999999999999999").status, 400);
}

TEST_F(HttpBridgeTest, LookupFailureIsServerErrorWithDescription) {
    fetcher_.result = make_status(StatusDomain::Net, StatusCode::Network, 502);
    const HttpResponse resp = request("GET", "/api/cats/7");
    EXPECT_EQ(resp.status, 500);
    EXPECT_EQ(resp.body, "fetch failure: upstream returned HTTP 502");
    EXPECT_TRUE(is_fetch_failure(last_status_));
}

TEST_F(HttpBridgeTest, UnknownPathIsNotFound) {
    EXPECT_EQ(request("GET", "/").status, 404);
    EXPECT_EQ(request("GET", "/api/cats").status, 404);
    EXPECT_EQ(request("GET", "/api/cats/7/extra").status, 404);
    EXPECT_EQ(request("GET", "/other/cats/7").status, 404);
}

TEST_F(HttpBridgeTest, WrongMethodIsNotAllowed) {
    const HttpResponse resp = request("POST", "/api/cats/7");
    EXPECT_EQ(resp.status, 405);
    EXPECT_EQ(fetcher_.calls, 0);
}

TEST_F(HttpBridgeTest, OptionsIsNoContent) {
    const HttpResponse resp = request("OPTIONS", "/api/cats/7");
    EXPECT_EQ(resp.status, 204);
    EXPECT_TRUE(resp.body.empty());
}

TEST(HttpBridge, ParseItemId) {
    rarity::core::u64 id = 0;
    EXPECT_TRUE(rarity::bindings::http::parse_item_id("0", &id));
    EXPECT_EQ(id, 0u);
    EXPECT_TRUE(rarity::bindings::http::parse_item_id("18446744073709551615", &id));
    EXPECT_EQ(id, 18446744073709551615ull);

    EXPECT_FALSE(rarity::bindings::http::parse_item_id("", &id));
    EXPECT_FALSE(rarity::bindings::http::parse_item_id(" 1", &id));
    EXPECT_FALSE(rarity::bindings::http::parse_item_id("1a", &id));
    EXPECT_FALSE(rarity::bindings::http::parse_item_id("18446744073709551616", &id));
    EXPECT_FALSE(rarity::bindings::http::parse_item_id("1", nullptr));
}

TEST(HttpBridge, ReasonPhrases) {
    EXPECT_STREQ(rarity::bindings::http::reason_phrase(200), "OK");
    EXPECT_STREQ(rarity::bindings::http::reason_phrase(404), "Not Found");
    EXPECT_STREQ(rarity::bindings::http::reason_phrase(500), "Internal Server Error");
}
