#include <tearoff/crypto/commitment.hpp>
#include <tearoff/crypto/partial_merkle_tree.hpp>
#include <tearoff/schema/encoding/scale/encoder.hpp>
#include <tearoff/transactions/traversable_transaction.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <iterator>
#include <type_traits>
#include <utility>

using namespace tearoff::schema;

namespace tearoff::transactions {

namespace {

using encoder_t = tearoff::schema::encoding::encoder<
    tearoff::schema::encoding::scale_encoder_tag>;

template <typename Group>
std::optional<std::size_t> find_slot(const std::vector<Group>& groups,
                                     const uint32_t index) {
  auto it = std::ranges::find_if(
      groups, [&](const Group& group) { return group.group_index == index; });
  if (it == std::end(groups)) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::distance(std::begin(groups), it));
}

}  // namespace

template <typename Group>
traversable_transaction<Group>::traversable_transaction(
    std::vector<Group> component_groups)
    : component_groups_{std::move(component_groups)}, cache_{make_cache()} {}

template <typename Group>
traversable_transaction<Group>::traversable_transaction(
    const traversable_transaction& other)
    : component_groups_{other.component_groups_}, cache_{make_cache()} {}

template <typename Group>
traversable_transaction<Group>& traversable_transaction<Group>::operator=(
    const traversable_transaction& other) {
  if (this != &other) {
    component_groups_ = other.component_groups_;
    cache_ = make_cache();
  }
  return *this;
}

template <typename Group>
std::unique_ptr<component_cache> traversable_transaction<Group>::make_cache()
    const {
  auto sizes = std::vector<std::size_t>{};
  sizes.reserve(component_groups_.size());
  for (const auto& group : component_groups_) {
    sizes.push_back(group.components.size());
  }
  return std::make_unique<component_cache>(sizes);
}

template <typename Group>
const std::vector<Group>& traversable_transaction<Group>::component_groups()
    const {
  return component_groups_;
}

template <typename Group>
const Group* traversable_transaction<Group>::find_group(
    const uint32_t group_index) const {
  auto slot = find_slot(component_groups_, group_index);
  if (!slot) {
    return nullptr;
  }
  return &component_groups_[*slot];
}

template <typename Group>
template <typename T>
tearoff::common::result<std::vector<T>>
traversable_transaction<Group>::deserialize_group(
    const component_group_type type,
    const deserialization_context context) const {
  const auto index = group_index(type);
  auto out = std::vector<T>{};
  auto slot = find_slot(component_groups_, index);
  if (!slot) {
    return out;
  }

  const auto& components = component_groups_[*slot].components;
  out.reserve(components.size());
  for (std::size_t i = 0; i < components.size(); ++i) {
    if (auto cached = cache_->find(*slot, i)) {
      out.push_back(std::get<T>(*cached));
      continue;
    }
    auto decoded = encoder_t{}.try_decode<T>(make_bytes_view(components[i]));
    if (!decoded) {
      return tearoff::common::make_malformed_error(
          fmt::format("{} component cannot be deserialised{}",
                      describe_group(index),
                      context == deserialization_context::attachments
                          ? " with attachments in scope"
                          : ""),
          index, i);
    }
    auto stored = cache_->store(*slot, i, decoded_component_t{std::move(*decoded)});
    out.push_back(std::get<T>(std::move(stored)));
  }
  return out;
}

template <typename Group>
tearoff::common::result<std::vector<state_ref_t>>
traversable_transaction<Group>::inputs() const {
  return deserialize_group<state_ref_t>(component_group_type::inputs,
                                        deserialization_context::standard);
}

template <typename Group>
tearoff::common::result<std::vector<transaction_state_t>>
traversable_transaction<Group>::outputs() const {
  return deserialize_group<transaction_state_t>(
      component_group_type::outputs, deserialization_context::attachments);
}

template <typename Group>
tearoff::common::result<std::vector<attachment_id_t>>
traversable_transaction<Group>::attachments() const {
  return deserialize_group<attachment_id_t>(component_group_type::attachments,
                                            deserialization_context::standard);
}

template <typename Group>
tearoff::common::result<std::vector<state_ref_t>>
traversable_transaction<Group>::references() const {
  return deserialize_group<state_ref_t>(component_group_type::references,
                                        deserialization_context::standard);
}

template <typename Group>
tearoff::common::result<std::vector<signers_t>>
traversable_transaction<Group>::signers() const {
  return deserialize_group<signers_t>(component_group_type::signers,
                                      deserialization_context::standard);
}

template <typename Group>
tearoff::common::result<std::optional<party_t>>
traversable_transaction<Group>::notary() const {
  auto notaries = deserialize_group<party_t>(
      component_group_type::notary, deserialization_context::standard);
  if (!notaries) {
    return notaries.error();
  }
  if (notaries.value().size() > 1) {
    return tearoff::common::make_malformed_error(
        "Invalid Transaction. More than 1 notary party detected.",
        group_index(component_group_type::notary));
  }
  if (notaries.value().empty()) {
    return std::optional<party_t>{};
  }
  return std::optional<party_t>{std::move(notaries.value().front())};
}

template <typename Group>
tearoff::common::result<std::optional<time_window_t>>
traversable_transaction<Group>::time_window() const {
  auto time_windows = deserialize_group<time_window_t>(
      component_group_type::time_window, deserialization_context::standard);
  if (!time_windows) {
    return time_windows.error();
  }
  if (time_windows.value().size() > 1) {
    return tearoff::common::make_malformed_error(
        "Invalid Transaction. More than 1 time-window detected.",
        group_index(component_group_type::time_window));
  }
  if (time_windows.value().empty()) {
    return std::optional<time_window_t>{};
  }
  return std::optional<time_window_t>{time_windows.value().front()};
}

template <typename Group>
tearoff::common::result<std::vector<command_t>>
traversable_transaction<Group>::commands() const {
  // Every signers entry is decoded even when only some commands are
  // revealed; a signers group that is not a list of keys is malformed.
  auto signers_list = signers();
  if (!signers_list) {
    return signers_list.error();
  }
  auto command_data_list = deserialize_group<command_data_t>(
      component_group_type::commands, deserialization_context::attachments);
  if (!command_data_list) {
    return command_data_list.error();
  }
  const auto& signer_sets = signers_list.value();
  auto& command_data = command_data_list.value();
  const auto commands_index = group_index(component_group_type::commands);

  auto out = std::vector<command_t>{};
  out.reserve(command_data.size());

  if constexpr (std::is_same_v<Group, filtered_component_group_t>) {
    // A filtered transaction without a commands group falls through to the
    // exact size check below.
    if (const auto* group = find_group(commands_index); group != nullptr) {
      if (command_data.size() > signer_sets.size()) {
        return tearoff::common::make_malformed_error(
            fmt::format("Invalid Transaction. Less Signers ({}) than "
                        "CommandData ({}) objects",
                        signer_sets.size(), command_data.size()),
            commands_index);
      }
      auto leaf_indices = std::vector<uint64_t>{};
      leaf_indices.reserve(command_data.size());
      for (std::size_t i = 0; i < group->components.size(); ++i) {
        auto hash = tearoff::crypto::component_hash(
            group->nonces[i], make_bytes_view(group->components[i]));
        auto leaf = tearoff::crypto::leaf_index(group->partial_tree, hash);
        if (!leaf) {
          return tearoff::common::make_malformed_error(
              "Invalid Transaction. Command is not part of the commands "
              "partial Merkle tree",
              commands_index, i);
        }
        leaf_indices.push_back(*leaf);
      }
      if (!leaf_indices.empty() &&
          *std::ranges::max_element(leaf_indices) >= signer_sets.size()) {
        return tearoff::common::make_malformed_error(
            "Invalid Transaction. A command with no corresponding signer "
            "detected",
            commands_index);
      }
      for (std::size_t i = 0; i < command_data.size(); ++i) {
        out.push_back(command_t{.data = std::move(command_data[i]),
                                .signers = signer_sets[leaf_indices[i]]});
      }
      return out;
    }
  }

  if (command_data.size() != signer_sets.size()) {
    return tearoff::common::make_malformed_error(
        fmt::format("Invalid Transaction. Sizes of CommandData ({}) and "
                    "Signers ({}) do not match",
                    command_data.size(), signer_sets.size()),
        commands_index);
  }
  for (std::size_t i = 0; i < command_data.size(); ++i) {
    out.push_back(command_t{.data = std::move(command_data[i]),
                            .signers = signer_sets[i]});
  }
  return out;
}

template <typename Group>
std::vector<opaque_component_t>
traversable_transaction<Group>::unknown_components(
    const uint32_t group_index) const {
  auto out = std::vector<opaque_component_t>{};
  const auto* group = find_group(group_index);
  if (group == nullptr) {
    return out;
  }
  out.reserve(group->components.size());
  for (const auto& component : group->components) {
    out.push_back(
        opaque_component_t{.group_index = group_index, .bytes = component});
  }
  return out;
}

template <typename Group>
tearoff::common::result<std::vector<std::vector<component_t>>>
traversable_transaction<Group>::available_component_groups() const {
  auto out = std::vector<std::vector<component_t>>{};
  auto append = [&](auto values) -> std::optional<tearoff::common::error_t> {
    if (!values) {
      return values.error();
    }
    auto& group = out.emplace_back();
    for (auto& value : values.value()) {
      group.emplace_back(std::move(value));
    }
    return std::nullopt;
  };

  if (auto error = append(inputs())) {
    return *error;
  }
  if (auto error = append(outputs())) {
    return *error;
  }
  if (auto error = append(commands())) {
    return *error;
  }
  if (auto error = append(attachments())) {
    return *error;
  }
  if (auto error = append(references())) {
    return *error;
  }

  auto notary_party = notary();
  if (!notary_party) {
    return notary_party.error();
  }
  if (notary_party.value()) {
    out.push_back({component_t{*notary_party.value()}});
  }
  auto window = time_window();
  if (!window) {
    return window.error();
  }
  if (window.value()) {
    out.push_back({component_t{*window.value()}});
  }
  return out;
}

template <typename Group>
tearoff::common::status_t traversable_transaction<Group>::check_invariants()
    const {
  if (auto values = inputs(); !values) {
    return values.error();
  }
  if (auto values = outputs(); !values) {
    return values.error();
  }
  if (auto values = commands(); !values) {
    return values.error();
  }
  if (auto values = attachments(); !values) {
    return values.error();
  }
  if (auto value = notary(); !value) {
    return value.error();
  }
  if (auto value = time_window(); !value) {
    return value.error();
  }
  if (auto values = references(); !values) {
    return values.error();
  }
  return tearoff::common::ok();
}

template class traversable_transaction<component_group_t>;
template class traversable_transaction<filtered_component_group_t>;

}  // namespace tearoff::transactions
