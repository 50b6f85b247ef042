#pragma once
#include <tearoff/schema/component_group.hpp>
#include <tearoff/schema/filtered_component_group.hpp>
#include <tearoff/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: transaction envelopes.
// What travels between parties. A wire transaction is re-derived (nonces,
// hashes, id) from its groups and privacy salt on receipt; a filtered
// transaction carries the id and group hashes it claims and has to be
// verified.
namespace tearoff::schema {

template <uint16_t Version>
struct wire_transaction_envelope;

template <>
struct wire_transaction_envelope<1> final {
  uint16_t version{1};
  std::vector<component_group_t> component_groups;
  hash32_t privacy_salt{};
};

template <uint16_t Version>
struct filtered_transaction_envelope;

template <>
struct filtered_transaction_envelope<1> final {
  uint16_t version{1};
  hash32_t id{};
  std::vector<filtered_component_group_t> filtered_component_groups;
  std::vector<hash32_t> group_hashes;
};

using wire_transaction_envelope_t = wire_transaction_envelope<1>;
using filtered_transaction_envelope_t = filtered_transaction_envelope<1>;

}  // namespace tearoff::schema
