#include <gtest/gtest.h>
#include "fixtree/core/hash.hpp"

using namespace fixtree::core;

TEST(HashTests, SHA256_KnownValue) {
  auto hash_value = sha256("hello");
  EXPECT_EQ(to_hex(hash_value),
            "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");
}

TEST(HashTests, SHA256_EmptyString) {
  auto hash_value = sha256("");
  EXPECT_EQ(to_hex(hash_value),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashTests, ToHex_FormatsLeadingZeros) {
  std::vector<uint8_t> data{0x00, 0x01, 0x0A, 0xFF};
  EXPECT_EQ(toHex(data), "00010aff");
}

TEST(HashTests, HashConcat_MatchesSha256OfJoinedBytes) {
  std::vector<uint8_t> left{'h', 'e'};
  std::vector<uint8_t> right{'l', 'l', 'o'};
  auto got = hash_concat(left, right);
  EXPECT_EQ(to_hex(got), to_hex(sha256("hello")));
}

TEST(HashTests, HashPair_IsOrderSensitive) {
  auto a = sha256("a");
  auto b = sha256("b");
  auto ab = hash_pair(a, b);
  EXPECT_NE(to_hex(ab), to_hex(hash_pair(b, a)));

  std::vector<uint8_t> joined(a.begin(), a.end());
  joined.insert(joined.end(), b.begin(), b.end());
  EXPECT_EQ(to_hex(ab), to_hex(sha256(std::span<const uint8_t>(joined.data(), joined.size()))));
}
