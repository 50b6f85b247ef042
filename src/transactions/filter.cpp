#include <tearoff/common/critical.hpp>
#include <tearoff/crypto/partial_merkle_tree.hpp>
#include <tearoff/schema/component_group_type.hpp>
#include <tearoff/transactions/filter.hpp>

#include <spdlog/spdlog.h>

#include <optional>
#include <utility>

using namespace tearoff::schema;

namespace tearoff::transactions {

namespace {

struct group_accumulator_t final {
  std::vector<bytes_t> components;
  std::vector<hash32_t> nonces;
  std::vector<hash32_t> hashes;
};

class filter_state final {
 public:
  filter_state(const wire_transaction& transaction,
               const component_predicate_t& predicate)
      : transaction_{transaction},
        predicate_{predicate},
        accumulators_(transaction.group_hashes().size()) {}

  void offer(const component_t& component,
             const uint32_t index,
             const std::size_t internal_index) {
    if (!predicate_(component)) {
      return;
    }
    const auto* group = transaction_.find_group(index);
    const auto* commitment = transaction_.commitment(index);
    if (group == nullptr || commitment == nullptr) {
      tearoff::common::critical("filtered component has no source group");
    }
    auto& accumulator = accumulators_[index];
    accumulator.components.push_back(group->components[internal_index]);
    accumulator.nonces.push_back(commitment->nonces[internal_index]);
    accumulator.hashes.push_back(commitment->component_hashes[internal_index]);

    if (index == group_index(component_group_type::commands) &&
        !signers_included_) {
      signers_included_ = true;
      include_signers();
    }
  }

  tearoff::common::result<std::vector<filtered_component_group_t>> finish()
      const {
    auto out = std::vector<filtered_component_group_t>{};
    for (uint32_t index = 0; index < accumulators_.size(); ++index) {
      const auto& accumulator = accumulators_[index];
      if (accumulator.components.empty()) {
        continue;
      }
      const auto* commitment = transaction_.commitment(index);
      auto partial = tearoff::crypto::build_partial_merkle_tree(
          commitment->tree, accumulator.hashes);
      if (!partial) {
        return partial.error();
      }
      out.push_back(filtered_component_group_t{
          .group_index = index,
          .components = accumulator.components,
          .nonces = accumulator.nonces,
          .partial_tree = std::move(partial).value()});
    }
    return out;
  }

 private:
  void include_signers() {
    const auto index = group_index(component_group_type::signers);
    const auto* group = transaction_.find_group(index);
    const auto* commitment = transaction_.commitment(index);
    if (group == nullptr || commitment == nullptr) {
      // commands always pair with a signers group in a valid transaction
      tearoff::common::critical("commands revealed without a signers group");
    }
    accumulators_[index] =
        group_accumulator_t{.components = group->components,
                            .nonces = commitment->nonces,
                            .hashes = commitment->component_hashes};
  }

  const wire_transaction& transaction_;
  const component_predicate_t& predicate_;
  std::vector<group_accumulator_t> accumulators_;
  bool signers_included_{false};
};

template <typename T>
tearoff::common::status_t offer_all(
    filter_state& state,
    const tearoff::common::result<std::vector<T>>& values,
    const component_group_type type) {
  if (!values) {
    return values.error();
  }
  for (std::size_t i = 0; i < values.value().size(); ++i) {
    state.offer(component_t{values.value()[i]}, group_index(type), i);
  }
  return tearoff::common::ok();
}

template <typename T>
tearoff::common::status_t offer_single(
    filter_state& state,
    const tearoff::common::result<std::optional<T>>& value,
    const component_group_type type) {
  if (!value) {
    return value.error();
  }
  if (value.value()) {
    state.offer(component_t{*value.value()}, group_index(type), 0);
  }
  return tearoff::common::ok();
}

}  // namespace

tearoff::common::result<filtered_transaction> build_filtered_transaction(
    const wire_transaction& transaction,
    const component_predicate_t& predicate) {
  auto state = filter_state{transaction, predicate};

  for (auto status :
       {offer_all(state, transaction.inputs(), component_group_type::inputs),
        offer_all(state, transaction.outputs(), component_group_type::outputs),
        offer_all(state, transaction.commands(),
                  component_group_type::commands),
        offer_all(state, transaction.attachments(),
                  component_group_type::attachments),
        offer_single(state, transaction.notary(), component_group_type::notary),
        offer_single(state, transaction.time_window(),
                     component_group_type::time_window),
        offer_all(state, transaction.references(),
                  component_group_type::references)}) {
    if (!status) {
      return status.error();
    }
  }
  for (const auto& group : transaction.component_groups()) {
    if (is_known_group(group.group_index)) {
      continue;
    }
    const auto unknown = transaction.unknown_components(group.group_index);
    for (std::size_t i = 0; i < unknown.size(); ++i) {
      state.offer(component_t{unknown[i]}, group.group_index, i);
    }
  }

  auto groups = state.finish();
  if (!groups) {
    return groups.error();
  }
  spdlog::debug("Filtered transaction {} down to {} component groups",
                to_hex(transaction.id()), groups.value().size());
  return filtered_transaction::make(transaction.id(),
                                    std::move(groups).value(),
                                    transaction.group_hashes());
}

}  // namespace tearoff::transactions
