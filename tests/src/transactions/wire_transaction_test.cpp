#include <gtest/gtest.h>
#include <tearoff/crypto/commitment.hpp>
#include <tearoff/crypto/merkle_tree.hpp>
#include <tearoff/schema/component_group_type.hpp>
#include <tearoff/schema/encoding/scale/encoder.hpp>
#include <tearoff/testing/common.hpp>
#include <tearoff/transactions/wire_transaction.hpp>

#include <algorithm>
#include <vector>

namespace {

using encoder_t = tearoff::schema::encoding::encoder<
    tearoff::schema::encoding::scale_encoder_tag>;
using tearoff::schema::component_group_t;
using tearoff::schema::component_group_type;
using tearoff::testing::make_hash;
using tearoff::transactions::wire_transaction;

component_group_t& group_of(std::vector<component_group_t>& groups,
                            const component_group_type type) {
  return *std::ranges::find(groups, tearoff::schema::group_index(type),
                            &component_group_t::group_index);
}

}  // namespace

TEST(wire_transaction, id_is_the_root_of_the_group_hashes) {
  auto transaction = tearoff::testing::make_wire_transaction();
  ASSERT_EQ(transaction.group_hashes().size(),
            tearoff::schema::kKnownComponentGroupCount);
  auto top = tearoff::crypto::merkle_tree::build(transaction.group_hashes());
  ASSERT_TRUE(top.has_value());
  EXPECT_EQ(transaction.id(), top.value().root());
}

TEST(wire_transaction, group_hashes_are_group_roots) {
  auto transaction = tearoff::testing::make_wire_transaction();
  for (const auto& group : transaction.component_groups()) {
    const auto* commitment = transaction.commitment(group.group_index);
    ASSERT_NE(commitment, nullptr);
    ASSERT_EQ(commitment->nonces.size(), group.components.size());
    for (std::size_t i = 0; i < group.components.size(); ++i) {
      auto nonce = tearoff::crypto::compute_nonce(
          transaction.privacy_salt(), group.group_index,
          static_cast<uint32_t>(i));
      EXPECT_EQ(commitment->nonces[i], nonce);
      EXPECT_EQ(commitment->component_hashes[i],
                tearoff::crypto::component_hash(
                    nonce, tearoff::schema::make_bytes_view(group.components[i])));
    }
    EXPECT_EQ(transaction.group_hashes()[group.group_index],
              commitment->tree.root());
  }
}

TEST(wire_transaction, absent_groups_hash_to_all_ones) {
  auto builder = tearoff::transactions::transaction_builder{};
  builder.add_input(tearoff::testing::make_state_ref(1, 0));
  auto transaction = builder.to_wire_transaction(make_hash(42));
  ASSERT_TRUE(transaction.has_value());
  const auto& hashes = transaction.value().group_hashes();
  ASSERT_EQ(hashes.size(), 8u);
  EXPECT_NE(hashes[0], tearoff::schema::make_all_ones_hash());
  for (std::size_t i = 1; i < hashes.size(); ++i) {
    EXPECT_EQ(hashes[i], tearoff::schema::make_all_ones_hash());
  }
  EXPECT_EQ(transaction.value().commitment(3), nullptr);
}

TEST(wire_transaction, unknown_groups_extend_the_group_hashes) {
  auto builder = tearoff::testing::make_builder();
  builder.add_unknown_component(11, tearoff::schema::bytes_t{9, 9, 9});
  auto transaction = builder.to_wire_transaction(make_hash(42));
  ASSERT_TRUE(transaction.has_value());
  ASSERT_EQ(transaction.value().group_hashes().size(), 12u);
  EXPECT_EQ(transaction.value().group_hashes()[10],
            tearoff::schema::make_all_ones_hash());
  EXPECT_NE(transaction.value().group_hashes()[11],
            tearoff::schema::make_all_ones_hash());
  EXPECT_NE(transaction.value().id(), tearoff::testing::make_wire_transaction().id());
}

TEST(wire_transaction, id_is_deterministic_and_salted) {
  auto first = tearoff::testing::make_wire_transaction();
  auto second = tearoff::testing::make_wire_transaction();
  EXPECT_EQ(first.id(), second.id());

  auto resalted = tearoff::testing::make_builder().to_wire_transaction();
  ASSERT_TRUE(resalted.has_value());
  EXPECT_NE(resalted.value().id(), first.id());
}

TEST(wire_transaction, group_order_does_not_change_the_id) {
  auto groups = tearoff::testing::make_builder().component_groups();
  std::ranges::reverse(groups);
  auto transaction = wire_transaction::make(groups, make_hash(42));
  ASSERT_TRUE(transaction.has_value());
  EXPECT_EQ(transaction.value().id(),
            tearoff::testing::make_wire_transaction().id());
  EXPECT_EQ(transaction.value().component_groups().front().group_index, 0u);
}

TEST(wire_transaction, envelope_round_trips) {
  auto transaction = tearoff::testing::make_wire_transaction();
  auto encoded = transaction.encode();
  auto decoded =
      wire_transaction::decode(tearoff::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded.value().id(), transaction.id());
  EXPECT_EQ(decoded.value().component_groups(), transaction.component_groups());
}

TEST(wire_transaction, decode_rejects_garbage) {
  auto bytes = tearoff::schema::bytes_t{0x01, 0x00, 0x04};
  auto decoded =
      wire_transaction::decode(tearoff::schema::make_bytes_view(bytes));
  ASSERT_TRUE(decoded.has_error());
  EXPECT_EQ(decoded.error().code,
            tearoff::common::error_code::malformed_transaction);
}

TEST(wire_transaction, rejects_structurally_invalid_group_lists) {
  auto salt = make_hash(42);
  auto groups = tearoff::testing::make_builder().component_groups();

  EXPECT_TRUE(wire_transaction::make({}, salt).has_error());
  EXPECT_TRUE(
      wire_transaction::make(groups, tearoff::schema::make_zero_hash())
          .has_error());

  auto duplicated = groups;
  duplicated.push_back(duplicated.front());
  auto result = wire_transaction::make(duplicated, salt);
  ASSERT_TRUE(result.has_error());
  EXPECT_EQ(result.error().group_index, 0u);

  auto empty = groups;
  empty.push_back(component_group_t{.group_index = 9});
  result = wire_transaction::make(empty, salt);
  ASSERT_TRUE(result.has_error());
  EXPECT_EQ(result.error().group_index, 9u);

  auto out_of_range = groups;
  out_of_range.push_back(component_group_t{
      .group_index = tearoff::schema::kMaxComponentGroupIndex + 1,
      .components = {tearoff::schema::bytes_t{1}}});
  EXPECT_TRUE(wire_transaction::make(out_of_range, salt).has_error());
}

TEST(wire_transaction, reports_the_component_that_does_not_deserialise) {
  auto groups = tearoff::testing::make_builder().component_groups();
  group_of(groups, component_group_type::inputs)
      .components.push_back(tearoff::schema::bytes_t{1, 2, 3});
  auto result = wire_transaction::make(groups, make_hash(42));
  ASSERT_TRUE(result.has_error());
  EXPECT_EQ(result.error().code,
            tearoff::common::error_code::malformed_transaction);
  EXPECT_EQ(result.error().group_index, 0u);
  EXPECT_EQ(result.error().component_index, 2u);
  EXPECT_NE(result.error().message().find("cannot be deserialised"),
            std::string::npos);
}

TEST(wire_transaction, rejects_more_than_one_notary_or_time_window) {
  auto groups = tearoff::testing::make_builder().component_groups();
  auto& notary = group_of(groups, component_group_type::notary);
  notary.components.push_back(
      encoder_t{}.encode(tearoff::testing::make_party("O=Other", 5)));
  auto result = wire_transaction::make(groups, make_hash(42));
  ASSERT_TRUE(result.has_error());
  EXPECT_NE(result.error().reason.find("More than 1 notary party detected"),
            std::string::npos);

  groups = tearoff::testing::make_builder().component_groups();
  auto& window = group_of(groups, component_group_type::time_window);
  window.components.push_back(window.components.front());
  result = wire_transaction::make(groups, make_hash(42));
  ASSERT_TRUE(result.has_error());
  EXPECT_NE(result.error().reason.find("More than 1 time-window detected"),
            std::string::npos);
}

TEST(wire_transaction, requires_one_signer_set_per_command) {
  auto groups = tearoff::testing::make_builder().component_groups();
  auto& signers = group_of(groups, component_group_type::signers);
  signers.components.pop_back();
  auto result = wire_transaction::make(groups, make_hash(42));
  ASSERT_TRUE(result.has_error());
  EXPECT_EQ(result.error().group_index,
            tearoff::schema::group_index(component_group_type::commands));
  EXPECT_NE(result.error().reason.find(
                "Sizes of CommandData (3) and Signers (2) do not match"),
            std::string::npos);
}
