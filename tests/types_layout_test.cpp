#include <gtest/gtest.h>
#include "rarity/core/errors.hpp"
#include "rarity/core/types.hpp"
#include "rarity/cli/commands.hpp"
#include "rarity/cli/options.hpp"
#include <cstddef>

using namespace rarity::core;

TEST(TypesLayout, Hash256IsRawDigest) {
    EXPECT_EQ(sizeof(Hash256), 32);
    EXPECT_EQ(alignof(Hash256), 1);
    EXPECT_EQ(offsetof(Hash256, b), 0);
    EXPECT_TRUE(std::is_trivially_copyable_v<Hash256>);
}

TEST(TypesLayout, StatusFitsInEightBytes) {
    EXPECT_EQ(sizeof(Status), 8);
    EXPECT_EQ(offsetof(Status, code), 0);
    EXPECT_EQ(offsetof(Status, domain), 2);
    EXPECT_EQ(offsetof(Status, aux), 4);
}

TEST(TypesLayout, Hash256Ordering) {
    Hash256 a{};
    Hash256 b{};
    b.b[31] = 1;
    EXPECT_TRUE(a < b);
    EXPECT_TRUE(a != b);
    b.b[31] = 0;
    EXPECT_TRUE(a == b);
}

TEST(TypesLayout, CliTypesArePlainData) {
    EXPECT_TRUE(std::is_trivially_copyable_v<rarity::cli::ParsedOption>);
    EXPECT_TRUE(std::is_standard_layout_v<rarity::cli::CommandInvocation>);
    EXPECT_EQ(sizeof(rarity::cli::OptionValue), 8);
}
