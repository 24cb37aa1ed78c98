#include <array>
#include <cstddef>
#include <string>

#include <gtest/gtest.h>

#include <blake3.h>

#include "rarity/cache/fingerprint.hpp"

TEST(Fingerprint, HashesCollectionColonId) {
    const std::string joined = "cool-cats:7";
    std::array<rarity::cache::u8, 32> direct{};
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, joined.data(), joined.size());
    blake3_hasher_finalize(&hasher, direct.data(), direct.size());

    rarity::cache::Fingerprint key{};
    ASSERT_TRUE(rarity::core::is_ok(rarity::cache::fingerprint("cool-cats", 7, &key)));
    for (size_t i = 0; i < direct.size(); ++i) {
        EXPECT_EQ(key.b[i], direct[i]) << "byte " << i;
    }
}

TEST(Fingerprint, EmptyCollectionStillHashes) {
    const std::string joined = ":0";
    std::array<rarity::cache::u8, 32> direct{};
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, joined.data(), joined.size());
    blake3_hasher_finalize(&hasher, direct.data(), direct.size());

    rarity::cache::Fingerprint key{};
    ASSERT_TRUE(rarity::core::is_ok(rarity::cache::fingerprint("", 0, &key)));
    EXPECT_EQ(key.b, direct);
}

t) {
    rarity::cache::Fingerprint x7a{};
    rarity::cache::Fingerprint x7b{};
    rarity::cache::Fingerprint x8{};
    rarity::cache::Fingerprint y7{};

    ASSERT_TRUE(rarity::core::is_ok(rarity::cache::fingerprint("X", 7, &x7a)));
    ASSERT_TRUE(rarity::core::is_ok(rarity::cache::fingerprint("X", 7, &x7b)));
    ASSERT_TRUE(rarity::core::is_ok(rarity::cache::fingerprint("X", 8, &x8)));
    ASSERT_TRUE(rarity::core::is_ok(rarity::cache::fingerprint("Y", 7, &y7)));

    EXPECT_EQ(x7a, x7b);
    EXPECT_NE(x7a, x8);
    EXPECT_NE(x7a, y7);
}

TEST(Fingerprint, SeparatorKeepsBoundariesApart) {
    // "a1:2" vs "a:12"
    rarity::cache::Fingerprint a{};
    rarity::cache::Fingerprint b{};
    ASSERT_TRUE(rarity::core::is_ok(rarity::cache::fingerprint("a1", 2, &a)));
    ASSERT_TRUE(rarity::core::is_ok(rarity::cache::fingerprint("a", 12, &b)));
    EXPECT_NE(a, b);
}

TEST(Fingerprint, NullOutIsInvalid) {
    const rarity::core::Status s = rarity::cache::fingerprint("X", 7, nullptr);
    EXPECT_EQ(s.code, rarity::core::StatusCode::Invalid);
}

TEST(Fingerprint, HexIsLowercaseAndFixedWidth) {
    rarity::cache::Fingerprint f{};
    f.b[0] = 0xAB;
    f.b[31] = 0x01;
    const std::string hex = rarity::cache::fingerprint_hex(f);
    ASSERT_EQ(hex.size(), 64u);
    EXPECT_EQ(hex.substr(0, 2), "ab");
    EXPECT_EQ(hex.substr(62, 2), "01");
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}
