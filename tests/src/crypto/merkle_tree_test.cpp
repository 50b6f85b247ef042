#include <gtest/gtest.h>
#include <tearoff/blake3/hash.hpp>
#include <tearoff/crypto/merkle_tree.hpp>
#include <tearoff/testing/common.hpp>

#include <string_view>
#include <vector>

using tearoff::testing::make_hash;

TEST(blake3, hashes_the_empty_input_to_the_reference_digest) {
  EXPECT_EQ(tearoff::schema::to_hex(tearoff::blake3::hash(std::string_view{})),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(blake3, hashing_parts_matches_hashing_their_concatenation) {
  auto left = make_hash(1);
  auto right = make_hash(2);
  auto joined = tearoff::schema::bytes_t{std::begin(left), std::end(left)};
  joined.insert(std::end(joined), std::begin(right), std::end(right));
  EXPECT_EQ(tearoff::blake3::hash({tearoff::schema::make_bytes_view(left),
                                   tearoff::schema::make_bytes_view(right)}),
            tearoff::blake3::hash(tearoff::schema::make_bytes_view(joined)));
}

TEST(merkle_tree, rejects_an_empty_leaf_list) {
  auto tree = tearoff::crypto::merkle_tree::build({});
  ASSERT_TRUE(tree.has_error());
  EXPECT_EQ(tree.error().code, tearoff::common::error_code::merkle_tree);
}

TEST(merkle_tree, single_leaf_is_its_own_root) {
  auto tree = tearoff::crypto::merkle_tree::build({make_hash(1)});
  ASSERT_TRUE(tree.has_value());
  EXPECT_EQ(tree.value().root(), make_hash(1));
  EXPECT_EQ(tree.value().height(), 0u);
}

TEST(merkle_tree, pads_odd_leaf_counts_with_zero_hashes) {
  auto leaves = std::vector{make_hash(1), make_hash(2), make_hash(3)};
  auto tree = tearoff::crypto::merkle_tree::build(leaves);
  ASSERT_TRUE(tree.has_value());

  using tearoff::crypto::hash_concat;
  auto expected =
      hash_concat(hash_concat(make_hash(1), make_hash(2)),
                  hash_concat(make_hash(3), tearoff::schema::make_zero_hash()));
  EXPECT_EQ(tree.value().root(), expected);
  EXPECT_EQ(tree.value().leaf_count(), 3u);
  EXPECT_EQ(tree.value().height(), 2u);
  EXPECT_EQ(tree.value().node(0, 3), tearoff::schema::make_zero_hash());
  EXPECT_EQ(tree.value().node(2, 0), expected);
}

TEST(merkle_tree, root_depends_on_leaf_order) {
  auto forward = tearoff::crypto::merkle_tree::build({make_hash(1), make_hash(2)});
  auto reverse = tearoff::crypto::merkle_tree::build({make_hash(2), make_hash(1)});
  ASSERT_TRUE(forward.has_value());
  ASSERT_TRUE(reverse.has_value());
  EXPECT_NE(forward.value().root(), reverse.value().root());
}
