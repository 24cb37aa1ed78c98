#pragma once
#include <map>
#include <string>

#include "rarity/core/types.hpp"

namespace rarity::core {
    struct Trait {
        std::string type;
        std::string name;
        std::string tier;
        double percentage{0.0};

        friend bool operator==(const Trait&, const Trait&) = default;
    };

    // One collectible's rarity profile at fetch time. Traits are keyed by trait type;
    // std::map keeps serialization order stable across runs.
    struct Item {
        std::string name;
        i64 rank{kMissingNumber};
        i64 total{kMissingNumber};
        double score{kMissingScore};
        std::map<std::string, Trait> traits;

        friend bool operator==(const Item&, const Item&) = default;
    };
} // namespace rarity::core
