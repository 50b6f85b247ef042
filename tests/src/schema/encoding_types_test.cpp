#include <gtest/gtest.h>
#include <tearoff/schema/command.hpp>
#include <tearoff/schema/encoding/scale/encoder.hpp>
#include <tearoff/schema/envelope.hpp>
#include <tearoff/schema/party.hpp>
#include <tearoff/schema/state_ref.hpp>
#include <tearoff/schema/time_window.hpp>
#include <tearoff/schema/transaction_state.hpp>
#include <tearoff/testing/common.hpp>

#include <string>
#include <vector>

namespace {

using encoder_t = tearoff::schema::encoding::encoder<
    tearoff::schema::encoding::scale_encoder_tag>;

template <typename T>
T round_trip(const T& value) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(value);
  return encoder.decode<T>(tearoff::schema::make_bytes_view(encoded));
}

}  // namespace

TEST(encoding_types, state_ref_encodes_hash_then_little_endian_index) {
  auto ref = tearoff::testing::make_state_ref(1, 0x01020304);
  auto encoded = encoder_t{}.encode(ref);
  ASSERT_EQ(encoded.size(), 36u);
  EXPECT_EQ(encoded[0], 1u);
  EXPECT_EQ(encoded[32], 0x04u);
  EXPECT_EQ(encoded[35], 0x01u);
}

TEST(encoding_types, components_round_trip) {
  auto state = tearoff::testing::make_output("42 EUR");
  state.encumbrance = 1;
  EXPECT_EQ(round_trip(state), state);

  auto window = tearoff::schema::time_window_t{.until_ms = 99};
  EXPECT_EQ(round_trip(window), window);

  auto signers = tearoff::schema::signers_t{tearoff::testing::alice(),
                                            tearoff::testing::bob()};
  EXPECT_EQ(round_trip(signers), signers);

  auto data = tearoff::testing::make_command_data("Move");
  data.parameters = {1, 2, 3};
  EXPECT_EQ(round_trip(data), data);
}

TEST(encoding_types, try_decode_rejects_truncated_bytes) {
  auto encoded = encoder_t{}.encode(tearoff::testing::make_party("O=Bank", 3));
  encoded.resize(encoded.size() - 5);
  auto decoded = encoder_t{}.try_decode<tearoff::schema::party_t>(
      tearoff::schema::make_bytes_view(encoded));
  EXPECT_FALSE(decoded.has_value());
}

TEST(encoding_types, filtered_envelope_round_trips) {
  auto group = tearoff::schema::filtered_component_group_t{
      .group_index = 3,
      .components = {tearoff::schema::bytes_t{7, 8}},
      .nonces = {tearoff::testing::make_hash(4)},
      .partial_tree = {.nodes = {{.kind = 0,
                                  .hash = tearoff::testing::make_hash(5)}}}};
  auto envelope = tearoff::schema::filtered_transaction_envelope_t{
      .id = tearoff::testing::make_hash(6),
      .filtered_component_groups = {group},
      .group_hashes = {tearoff::testing::make_hash(7)}};
  auto decoded = round_trip(envelope);
  EXPECT_EQ(decoded.version, 1u);
  EXPECT_EQ(decoded.id, envelope.id);
  EXPECT_EQ(decoded.filtered_component_groups, envelope.filtered_component_groups);
  EXPECT_EQ(decoded.group_hashes, envelope.group_hashes);
}
