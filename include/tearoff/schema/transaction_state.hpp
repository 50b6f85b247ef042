#pragma once
#include <tearoff/schema/party.hpp>
#include <tearoff/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: transaction state.
// Output of a transaction: opaque contract state data governed by
// `contract`, assigned to a notary, optionally encumbered by another output
// of the same transaction.
namespace tearoff::schema {

struct transaction_state_t final {
  bytes_t data;
  std::string contract;
  party_t notary;
  std::optional<uint32_t> encumbrance{std::nullopt};

  bool operator==(const transaction_state_t&) const = default;
};

}  // namespace tearoff::schema
