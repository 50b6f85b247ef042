#pragma once
#include <tearoff/common/result.hpp>
#include <tearoff/schema/component.hpp>
#include <tearoff/schema/component_group.hpp>
#include <tearoff/schema/component_group_type.hpp>
#include <tearoff/schema/filtered_component_group.hpp>
#include <tearoff/transactions/component_cache.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace tearoff::transactions {

/// Outputs and commands are decoded with the transaction's attachments in
/// scope; everything else in the standard context.
enum class deserialization_context : uint8_t { standard = 0, attachments = 1 };

/// Typed, lazily decoded view over the component groups of a transaction.
///
/// `Group` is schema::component_group_t for a full wire transaction and
/// schema::filtered_component_group_t for a filtered one. Some groups may be
/// missing or partial in the filtered case; a missing group reads as empty.
/// Components are decoded on first access and memoized, so a view that only
/// consults its commands never pays for decoding its outputs.
///
/// Accessors are safe to call concurrently on the same instance.
template <typename Group>
class traversable_transaction {
 public:
  explicit traversable_transaction(std::vector<Group> component_groups);

  traversable_transaction(const traversable_transaction& other);
  traversable_transaction& operator=(const traversable_transaction& other);
  traversable_transaction(traversable_transaction&&) noexcept = default;
  traversable_transaction& operator=(traversable_transaction&&) noexcept =
      default;
  ~traversable_transaction() = default;

  const std::vector<Group>& component_groups() const;

  /// nullptr when the transaction carries no group with that index.
  const Group* find_group(uint32_t group_index) const;

  tearoff::common::result<std::vector<tearoff::schema::state_ref_t>> inputs()
      const;
  tearoff::common::result<std::vector<tearoff::schema::transaction_state_t>>
  outputs() const;

  /// Commands paired with their signers. In a full transaction command i
  /// pairs with signers entry i. In a filtered transaction the signers entry
  /// is the one at the command's original position, recovered from the
  /// commands group's partial tree.
  tearoff::common::result<std::vector<tearoff::schema::command_t>> commands()
      const;

  tearoff::common::result<std::vector<tearoff::schema::attachment_id_t>>
  attachments() const;
  tearoff::common::result<std::optional<tearoff::schema::party_t>> notary()
      const;
  tearoff::common::result<std::optional<tearoff::schema::time_window_t>>
  time_window() const;
  tearoff::common::result<std::vector<tearoff::schema::state_ref_t>>
  references() const;

  /// Raw signer sets of the signers group, in group order.
  tearoff::common::result<std::vector<tearoff::schema::signers_t>> signers()
      const;

  /// Components of a group this version does not know, as opaque values.
  std::vector<tearoff::schema::opaque_component_t> unknown_components(
      uint32_t group_index) const;

  /// Every visible typed component, grouped as inputs, outputs, commands,
  /// attachments, references, then notary and time window when present.
  tearoff::common::result<std::vector<std::vector<tearoff::schema::component_t>>>
  available_component_groups() const;

  /// Decodes every known group once and checks the singleton cardinalities
  /// and command/signer pairing. The first failure is returned.
  tearoff::common::status_t check_invariants() const;

 private:
  template <typename T>
  tearoff::common::result<std::vector<T>> deserialize_group(
      tearoff::schema::component_group_type type,
      deserialization_context context) const;

  std::unique_ptr<component_cache> make_cache() const;

  std::vector<Group> component_groups_;
  std::unique_ptr<component_cache> cache_;
};

extern template class traversable_transaction<
    tearoff::schema::component_group_t>;
extern template class traversable_transaction<
    tearoff::schema::filtered_component_group_t>;

}  // namespace tearoff::transactions
