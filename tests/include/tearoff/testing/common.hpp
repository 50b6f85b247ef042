#pragma once

#include <tearoff/common/critical.hpp>
#include <tearoff/schema/component.hpp>
#include <tearoff/schema/primitives.hpp>
#include <tearoff/transactions/transaction_builder.hpp>
#include <tearoff/transactions/wire_transaction.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace tearoff::testing {

inline tearoff::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = tearoff::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline tearoff::schema::public_key_t make_ed25519_key(const uint8_t seed) {
  auto key = tearoff::schema::ed25519_public_key_t{};
  for (std::size_t i = 0; i < key.public_key.size(); ++i) {
    key.public_key[i] = static_cast<uint8_t>(seed * 3 + static_cast<uint8_t>(i));
  }
  return key;
}

inline tearoff::schema::party_t make_party(const std::string& name,
                                           const uint8_t seed) {
  return tearoff::schema::party_t{.name = name,
                                  .owning_key = make_ed25519_key(seed)};
}

inline tearoff::schema::state_ref_t make_state_ref(const uint8_t seed,
                                                   const uint32_t index) {
  return tearoff::schema::state_ref_t{.transaction_id = make_hash(seed),
                                      .index = index};
}

inline tearoff::schema::command_data_t make_command_data(
    const std::string& name) {
  return tearoff::schema::command_data_t{.contract = "com.example.Cash",
                                         .name = name};
}

inline tearoff::schema::transaction_state_t make_output(
    const std::string& data) {
  return tearoff::schema::transaction_state_t{
      .data = tearoff::schema::make_bytes(data),
      .contract = "com.example.Cash",
      .notary = make_party("O=Notary,L=London,C=GB", 9)};
}

/// Alice and Bob, the signers of the three-command fixture.
inline tearoff::schema::public_key_t alice() {
  return make_ed25519_key(1);
}
inline tearoff::schema::public_key_t bob() {
  return make_ed25519_key(2);
}

/// One component in every known group, two inputs, and three commands
/// signed by {alice}, {alice, bob} and {bob}.
inline tearoff::transactions::transaction_builder make_builder() {
  auto builder = tearoff::transactions::transaction_builder{};
  builder.add_input(make_state_ref(10, 0))
      .add_input(make_state_ref(10, 1))
      .add_output(make_output("100 GBP"))
      .add_output(make_output("50 GBP"))
      .add_command(make_command_data("Move"), {alice()})
      .add_command(make_command_data("Issue"), {alice(), bob()})
      .add_command(make_command_data("Exit"), {bob()})
      .add_attachment(tearoff::schema::attachment_id_t{.hash = make_hash(20)})
      .set_notary(make_party("O=Notary,L=London,C=GB", 9))
      .set_time_window(tearoff::schema::time_window_t{.from_ms = 1000,
                                                      .until_ms = 2000})
      .add_reference(make_state_ref(11, 4));
  return builder;
}

inline tearoff::transactions::wire_transaction make_wire_transaction() {
  auto transaction = make_builder().to_wire_transaction(make_hash(42));
  if (!transaction) {
    tearoff::common::critical(transaction.error().message());
  }
  return std::move(transaction).value();
}

template <typename T>
bool holds(const tearoff::schema::component_t& component) {
  return std::holds_alternative<T>(component);
}

}  // namespace tearoff::testing
