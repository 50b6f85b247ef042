#pragma once
#include <tearoff/common/result.hpp>
#include <tearoff/schema/component.hpp>
#include <tearoff/schema/component_group_type.hpp>
#include <tearoff/schema/filtered_component_group.hpp>
#include <tearoff/schema/primitives.hpp>
#include <tearoff/transactions/traversable_transaction.hpp>
#include <cstdint>
#include <vector>

namespace tearoff::transactions {

/// A tear-off of a wire transaction: some components revealed, the rest
/// represented only by hashes. Carries the id and group hashes it claims;
/// nothing about it is trusted until verify() passes.
class filtered_transaction final
    : public traversable_transaction<
          tearoff::schema::filtered_component_group_t> {
 public:
  /// Accepts a received filtered transaction. Fails when a group's nonce and
  /// component counts differ, a group index repeats or is out of range.
  /// Groups are kept sorted by index.
  static tearoff::common::result<filtered_transaction> make(
      const tearoff::schema::hash32_t& id,
      std::vector<tearoff::schema::filtered_component_group_t>
          filtered_component_groups,
      std::vector<tearoff::schema::hash32_t> group_hashes);

  static tearoff::common::result<filtered_transaction> decode(
      const tearoff::schema::bytes_view_t& bytes);
  tearoff::schema::bytes_t encode() const;

  const tearoff::schema::hash32_t& id() const;
  const std::vector<tearoff::schema::filtered_component_group_t>&
  filtered_component_groups() const;
  const std::vector<tearoff::schema::hash32_t>& group_hashes() const;

  /// Proves that every revealed component belongs to the transaction with
  /// this id. A transaction with no revealed groups verifies on the id alone.
  tearoff::common::status_t verify() const;

  /// Proves that the group was revealed in full, or that it is absent from
  /// the original transaction.
  tearoff::common::status_t check_all_components_visible(
      tearoff::schema::component_group_type type) const;
  tearoff::common::status_t check_all_components_visible(
      uint32_t group_index) const;

  /// Proves that every command `key` is required to sign is revealed.
  tearoff::common::status_t check_command_visibility(
      const tearoff::schema::public_key_t& key) const;

  /// True when at least one typed component is revealed and `predicate`
  /// holds for all of them.
  tearoff::common::result<bool> check_with_fun(
      const tearoff::schema::component_predicate_t& predicate) const;

 private:
  filtered_transaction(
      const tearoff::schema::hash32_t& id,
      std::vector<tearoff::schema::filtered_component_group_t>
          filtered_component_groups,
      std::vector<tearoff::schema::hash32_t> group_hashes);

  tearoff::schema::hash32_t id_;
  std::vector<tearoff::schema::hash32_t> group_hashes_;
};

}  // namespace tearoff::transactions
