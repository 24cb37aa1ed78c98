#include <string>

#include <gtest/gtest.h>

#include "rarity/extract/pipeline.hpp"

using namespace rarity::core;
using rarity::extract::extract_item;

namespace {

std::string trait_block(const char* title, const char* pct, const char* tier) {
    std::string s = "<div class=\"trait\">";
    s += "<h3 class=\"tier-title\">";
    s += title;
    s += "</h3><div class=\"item-rarity-percentage\">";
    s += pct;
    s += "</div><div class=\"item-rarity-tier\">";
    s += tier;
    s += "</div></div>";
    return s;
}

std::string page(const std::string& traits) {
    return "<html><body>"
           "<h2>Cool Cat #7</h2>"
           "<button class=\"btn item-rarity-rank\">Rank 12 / 500</button>"
           "<button class=\"item-trait-data\">Rarity Score: 87.42</button>" +
           traits + "</body></html>";
}

Item sentinel_item() {
    Item it;
    it.name = "untouched";
    return it;
}

} // namespace

TEST(ExtractItem, BuildsCompleteItem) {
    const std::string html = page(trait_block("Background: Blue", " 3.5% ", "Rare") +
                                  trait_block("Eyes: Laser", "0.8%", "Legendary"));

    Item item;
    const Status s = extract_item(html, &item);
    ASSERT_TRUE(is_ok(s));

    EXPECT_EQ(item.name, "Cool Cat #7");
    EXPECT_EQ(item.rank, 12);
    EXPECT_EQ(item.total, 500);
    EXPECT_DOUBLE_EQ(item.score, 87.42);
    ASSERT_EQ(item.traits.size(), 2u);

    const Trait& bg = item.traits.at("Background");
    EXPECT_EQ(bg.type, "Background");
    EXPECT_EQ(bg.name, "Blue");
    EXPECT_EQ(bg.tier, "Rare");
    EXPECT_DOUBLE_EQ(bg.percentage, 3.5);

    const Trait& eyes = item.traits.at("Eyes");
    EXPECT_EQ(eyes.name, "Laser");
    EXPECT_EQ(eyes.tier, "Legendary");
    EXPECT_DOUBLE_EQ(eyes.percentage, 0.8);
}

TEST(ExtractItem, NoTraitsIsStillAnItem) {
    Item item;
    ASSERT_TRUE(is_ok(extract_item(page(""), &item)));
    EXPECT_TRUE(item.traits.empty());
    EXPECT_EQ(item.rank, 12);
}

TEST(ExtractItem, DuplicateTraitTypeLastWins) {
    const std::string html = page(trait_block("Hat: Cap", "10%", "Common") +
                                  trait_block("Hat: Crown", "1%", "Epic"));

    Item item;
    ASSERT_TRUE(is_ok(extract_item(html, &item)));
    ASSERT_EQ(item.traits.size(), 1u);
    EXPECT_EQ(item.traits.at("Hat").name, "Crown");
    EXPECT_EQ(item.traits.at("Hat").tier, "Epic");
    EXPECT_DOUBLE_EQ(item.traits.at("Hat").percentage, 1.0);
}

TEST(ExtractItem, UnparsableLabelsGiveSentinels) {
    const std::string html =
        "<html><body><h2>Nameless</h2>"
        "<button class=\"item-rarity-rank\">unranked</button>"
        "<button class=\"item-trait-data\">no score yet</button>"
        "</body></html>";

    Item item;
    ASSERT_TRUE(is_ok(extract_item(html, &item)));
    EXPECT_EQ(item.rank, kMissingNumber);
    EXPECT_EQ(item.total, kMissingNumber);
    EXPECT_DOUBLE_EQ(item.score, kMissingScore);
}

TEST(ExtractItem, UnbalancedTraitsProduceNoItem) {
    const std::string html = page(trait_block("Background: Blue", "3.5%", "Rare") +
                                  "<div class=\"item-rarity-tier\">Orphan</div>");

    Item item = sentinel_item();
    const Status s = extract_item(html, &item);
    EXPECT_TRUE(is_unbalanced(s));
    EXPECT_EQ(s.aux, 1u);
    EXPECT_EQ(item, sentinel_item());
}

TEST(ExtractItem, MissingNameIsNodeNotFound) {
    const std::string html =
        "<html><body>"
        "<button class=\"item-rarity-rank\">Rank 1 / 2</button>"
        "<button class=\"item-trait-data\">Rarity Score: 1</button>"
        "</body></html>";

    Item item = sentinel_item();
    EXPECT_TRUE(is_node_not_found(extract_item(html, &item)));
    EXPECT_EQ(item, sentinel_item());
}

TEST(ExtractItem, MissingRankButtonIsNodeNotFound) {
    const std::string html =
        "<html><body><h2>A</h2>"
        "<button class=\"item-trait-data\">Rarity Score: 1</button>"
        "</body></html>";

    Item item;
    EXPECT_TRUE(is_node_not_found(extract_item(html, &item)));
}

TEST(ExtractItem, TraitWithoutTextIsNodeNotFound) {
    const std::string html = page(trait_block("Background: Blue", "3.5%", ""));

    Item item;
    EXPECT_TRUE(is_node_not_found(extract_item(html, &item)));
}

TEST(ExtractItem, EmptyPageIsParseFailure) {
    Item item = sentinel_item();
    EXPECT_TRUE(is_parse_failure(extract_item("", &item)));
    EXPECT_EQ(item, sentinel_item());
}

TEST(ExtractItem, MalformedPercentageFailsWithIndex) {
    const std::string html = page(trait_block("Background: Blue", "3.5%", "Rare") +
                                  trait_block("Eyes: Laser", "unknown", "Legendary"));

    Item item = sentinel_item();
    const Status s = extract_item(html, &item);
    EXPECT_EQ(s.domain, StatusDomain::Parse);
    EXPECT_EQ(s.code, StatusCode::Malformed);
    EXPECT_EQ(s.aux, 1u);
    EXPECT_EQ(item, sentinel_item());
}

TEST(ExtractItem, CustomLayout) {
    rarity::extract::PageLayout layout;
    layout.name = rarity::html::Selector{"h1", "id", "title"};

    const std::string html =
        "<html><body><h1 id=\"title\">Custom</h1>"
        "<button class=\"item-rarity-rank\">Rank 5 / 9</button>"
        "<button class=\"item-trait-data\">Rarity Score: 2.5</button>"
        "</body></html>";

    Item item;
    ASSERT_TRUE(is_ok(extract_item(html, layout, &item)));
    EXPECT_EQ(item.name, "Custom");
    EXPECT_EQ(item.rank, 5);
}

TEST(ExtractItem, NullOutIsInvalid) {
    const Status s = extract_item(page(""), nullptr);
    EXPECT_EQ(s.domain, StatusDomain::Extract);
    EXPECT_EQ(s.code, StatusCode::Invalid);
}
