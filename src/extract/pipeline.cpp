#include "rarity/extract/pipeline.hpp"

#include <string>
#include <utility>
#include <vector>

#include "rarity/parse/fields.hpp"

namespace rarity::extract {

using namespace rarity::core;
using rarity::html::Document;
using rarity::html::Node;

namespace {
    [[nodiscard]] Status single_text(const Document& doc, const rarity::html::Selector& sel, std::string* out) noexcept {
        Node node;
        Status s = doc.find_one(sel, &node);
        if (!is_ok(s)) {
            return s;
        }
        return node.first_text(out);
    }
} // namespace

const PageLayout& default_layout() noexcept {
    static const PageLayout layout{};
    return layout;
}

Status extract_item(std::string_view raw_html, Item* out) noexcept {
    return extract_item(raw_html, default_layout(), out);
}

Status extract_item(std::string_view raw_html, const PageLayout& layout, Item* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Extract, StatusCode::Invalid);
    }

    Document doc;
    const Status s = Document::parse(raw_html, &doc);
    if (!is_ok(s)) {
        return s;
    }
    return extract_item(doc, layout, out);
}

Status extract_item(const Document& doc, const PageLayout& layout, Item* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Extract, StatusCode::Invalid);
    }

    std::string name;
    std::string rank_text;
    std::string score_text;

    Status s = single_text(doc, layout.name, &name);
    if (!is_ok(s)) return s;
    s = single_text(doc, layout.rank, &rank_text);
    if (!is_ok(s)) return s;
    s = single_text(doc, layout.score, &score_text);
    if (!is_ok(s)) return s;

    std::vector<Node> titles;
    std::vector<Node> percentages;
    std::vector<Node> tiers;

    s = doc.find_all(layout.trait_titles, &titles);
    if (!is_ok(s)) return s;
    s = doc.find_all(layout.trait_percentages, &percentages);
    if (!is_ok(s)) return s;
    s = doc.find_all(layout.trait_tiers, &tiers);
    if (!is_ok(s)) return s;

    // Pairing by index is only meaningful when the three lists line up.
    if (titles.size() != percentages.size() || percentages.size() != tiers.size()) {
        return make_status(StatusDomain::Extract, StatusCode::Unbalanced,
                           static_cast<u32>(titles.size()));
    }

    Item item;
    item.name = std::move(name);

    const rarity::parse::RankInfo rank = rarity::parse::parse_rank(rank_text);
    item.rank = rank.rank;
    item.total = rank.total;
    item.score = rarity::parse::parse_rarity_score(score_text);

    std::string title_text;
    std::string percentage_text;
    for (size_t i = 0; i < titles.size(); ++i) {
        Trait trait;

        s = titles[i].first_text(&title_text);
        if (!is_ok(s)) return s;
        s = percentages[i].first_text(&percentage_text);
        if (!is_ok(s)) return s;
        s = tiers[i].first_text(&trait.tier);
        if (!is_ok(s)) return s;

        rarity::parse::TraitEntry entry = rarity::parse::parse_trait_entry(title_text);
        s = rarity::parse::parse_percentage(percentage_text, &trait.percentage);
        if (!is_ok(s)) {
            s.aux = static_cast<u32>(i);
            return s;
        }

        trait.type = std::move(entry.type);
        trait.name = std::move(entry.value);

        // Duplicate trait types: the later block wins.
        std::string key = trait.type;
        item.traits.insert_or_assign(std::move(key), std::move(trait));
    }

    *out = std::move(item);
    return ok_status();
}

} // namespace rarity::extract
