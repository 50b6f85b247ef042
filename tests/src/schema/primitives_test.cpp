#include <gtest/gtest.h>
#include <tearoff/schema/component_group_type.hpp>
#include <tearoff/schema/primitives.hpp>

#include <string_view>
#include <unordered_set>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = tearoff::schema::bytes_t(32, 0xAB);
  auto hash = tearoff::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = tearoff::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
  EXPECT_EQ(tearoff::schema::to_hex(hash),
            "0102030405060708090a0b0c0d0e0f10"
            "1112131415161718191a1b1c1d1e1f20");
}

TEST(primitives, try_make_hash32_rejects_short_and_invalid_hex) {
  EXPECT_FALSE(tearoff::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(
      tearoff::schema::try_make_hash32(std::string(64, 'z')).has_value());
  EXPECT_FALSE(tearoff::schema::try_from_hex("abc").has_value());
}

TEST(primitives, sentinel_hashes_are_distinct) {
  auto zero = tearoff::schema::make_zero_hash();
  auto ones = tearoff::schema::make_all_ones_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
  for (auto byte : ones) {
    EXPECT_EQ(byte, 0xFFu);
  }
  EXPECT_NE(zero, ones);
}

TEST(primitives, try_make_public_key_picks_the_key_type_from_its_length) {
  auto ed25519 = tearoff::schema::try_make_public_key(
      tearoff::schema::make_bytes_view(tearoff::schema::bytes_t(32, 0x11)));
  ASSERT_TRUE(ed25519.has_value());
  EXPECT_TRUE(
      std::holds_alternative<tearoff::schema::ed25519_public_key_t>(*ed25519));

  auto compressed = tearoff::schema::bytes_t(33, 0x22);
  compressed[0] = 0x03;
  auto secp = tearoff::schema::try_make_public_key(
      tearoff::schema::make_bytes_view(compressed));
  ASSERT_TRUE(secp.has_value());
  EXPECT_TRUE(
      std::holds_alternative<tearoff::schema::secp256k1_public_key_t>(*secp));
  EXPECT_EQ(tearoff::schema::make_bytes(
                tearoff::schema::public_key_bytes(*secp)),
            compressed);

  compressed[0] = 0x04;
  EXPECT_FALSE(tearoff::schema::try_make_public_key(
                   tearoff::schema::make_bytes_view(compressed))
                   .has_value());
}

TEST(primitives, public_keys_are_usable_as_set_members) {
  auto first = tearoff::schema::ed25519_public_key_t{};
  first.public_key.fill(1);
  auto second = tearoff::schema::ed25519_public_key_t{};
  second.public_key.fill(2);
  auto keys = std::unordered_set<tearoff::schema::public_key_t>{};
  keys.insert(first);
  keys.insert(second);
  keys.insert(first);
  EXPECT_EQ(keys.size(), 2u);
  EXPECT_TRUE(keys.contains(tearoff::schema::public_key_t{second}));
}

TEST(component_group_type, names_round_trip) {
  for (auto index = uint32_t{0};
       index < tearoff::schema::kKnownComponentGroupCount; ++index) {
    auto type = tearoff::schema::try_component_group_type(index);
    ASSERT_TRUE(type.has_value());
    auto parsed = tearoff::schema::component_group_type_from_string(
        tearoff::schema::to_string(*type));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(tearoff::schema::group_index(*parsed), index);
  }
  EXPECT_FALSE(tearoff::schema::try_component_group_type(8).has_value());
  EXPECT_FALSE(
      tearoff::schema::component_group_type_from_string("bogus").has_value());
}

TEST(component_group_type, describes_known_and_unknown_groups) {
  EXPECT_EQ(tearoff::schema::describe_group(5), "time_window group");
  EXPECT_EQ(tearoff::schema::describe_group(12), "group 12");
}
