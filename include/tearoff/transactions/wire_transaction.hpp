#pragma once
#include <tearoff/common/result.hpp>
#include <tearoff/crypto/merkle_tree.hpp>
#include <tearoff/schema/component_group.hpp>
#include <tearoff/schema/primitives.hpp>
#include <tearoff/transactions/traversable_transaction.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace tearoff::transactions {

/// Nonces, leaf hashes and full Merkle tree of one component group, in
/// component order.
struct group_commitment_t final {
  std::vector<tearoff::schema::hash32_t> nonces;
  std::vector<tearoff::schema::hash32_t> component_hashes;
  tearoff::crypto::merkle_tree tree;
};

/// A complete transaction: every component group plus the privacy salt the
/// nonces derive from. Immutable once made; the id commits to every
/// component of every group.
class wire_transaction final
    : public traversable_transaction<tearoff::schema::component_group_t> {
 public:
  /// Validates the groups and precomputes every commitment. Fails with a
  /// malformed_transaction error when there are no groups, a group is empty,
  /// duplicated or out of range, the salt is all zero, or a known group does
  /// not decode to its type.
  static tearoff::common::result<wire_transaction> make(
      std::vector<tearoff::schema::component_group_t> component_groups,
      const tearoff::schema::hash32_t& privacy_salt);

  static tearoff::common::result<wire_transaction> decode(
      const tearoff::schema::bytes_view_t& bytes);
  tearoff::schema::bytes_t encode() const;

  const tearoff::schema::hash32_t& id() const;
  const tearoff::schema::hash32_t& privacy_salt() const;

  /// Root of every group at its index; all-ones for absent indexes.
  const std::vector<tearoff::schema::hash32_t>& group_hashes() const;

  /// nullptr when the transaction has no group with that index.
  const group_commitment_t* commitment(uint32_t group_index) const;

 private:
  wire_transaction(
      std::vector<tearoff::schema::component_group_t> component_groups,
      const tearoff::schema::hash32_t& privacy_salt,
      std::vector<std::optional<group_commitment_t>> commitments,
      std::vector<tearoff::schema::hash32_t> group_hashes,
      const tearoff::schema::hash32_t& id);

  tearoff::schema::hash32_t privacy_salt_;
  std::vector<std::optional<group_commitment_t>> commitments_;
  std::vector<tearoff::schema::hash32_t> group_hashes_;
  tearoff::schema::hash32_t id_;
};

}  // namespace tearoff::transactions
