#include "rarity/codec/item_json.hpp"

#include <new>
#include <utility>

#include <nlohmann/json.hpp>

namespace rarity::core {

// ADL hooks for nlohmann::json.
void to_json(nlohmann::json& j, const Trait& t) {
    j = nlohmann::json{
        {"type", t.type},
        {"name", t.name},
        {"tier", t.tier},
        {"percentage", t.percentage},
    };
}

void from_json(const nlohmann::json& j, Trait& t) {
    j.at("type").get_to(t.type);
    j.at("name").get_to(t.name);
    j.at("tier").get_to(t.tier);
    j.at("percentage").get_to(t.percentage);
}

void to_json(nlohmann::json& j, const Item& item) {
    j = nlohmann::json{
        {"name", item.name},
        {"rank", item.rank},
        {"total", item.total},
        {"score", item.score},
        {"traits", item.traits},
    };
}

void from_json(const nlohmann::json& j, Item& item) {
    j.at("name").get_to(item.name);
    j.at("rank").get_to(item.rank);
    j.at("total").get_to(item.total);
    j.at("score").get_to(item.score);
    j.at("traits").get_to(item.traits);
}

} // namespace rarity::core

namespace rarity::codec {

using namespace rarity::core;

Status item_to_json(const Item& item, std::string* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Codec, StatusCode::Invalid);
    }
    try {
        const nlohmann::json j = item;
        // Invalid UTF-8 scraped from the page is replaced rather than rejected.
        *out = j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        return make_status(StatusDomain::Codec, StatusCode::Malformed, static_cast<u32>(e.id));
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Codec, StatusCode::Unknown);
    }
    return ok_status();
}

Status item_from_json(std::string_view text, Item* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Codec, StatusCode::Invalid);
    }
    try {
        const nlohmann::json j = nlohmann::json::parse(text);
        Item item = j.get<Item>();
        *out = std::move(item);
    } catch (const nlohmann::json::exception& e) {
        return make_status(StatusDomain::Codec, StatusCode::Malformed, static_cast<u32>(e.id));
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Codec, StatusCode::Unknown);
    }
    return ok_status();
}

} // namespace rarity::codec
