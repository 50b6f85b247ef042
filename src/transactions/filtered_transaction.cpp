#include <tearoff/crypto/commitment.hpp>
#include <tearoff/crypto/merkle_tree.hpp>
#include <tearoff/crypto/partial_merkle_tree.hpp>
#include <tearoff/schema/encoding/scale/encoder.hpp>
#include <tearoff/schema/envelope.hpp>
#include <tearoff/transactions/filtered_transaction.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

using namespace tearoff::schema;

namespace tearoff::transactions {

namespace {

using encoder_t = tearoff::schema::encoding::encoder<
    tearoff::schema::encoding::scale_encoder_tag>;

std::vector<hash32_t> recompute_component_hashes(
    const filtered_component_group_t& group) {
  auto hashes = std::vector<hash32_t>{};
  hashes.reserve(group.components.size());
  for (std::size_t i = 0; i < group.components.size(); ++i) {
    hashes.push_back(tearoff::crypto::component_hash(
        group.nonces[i], make_bytes_view(group.components[i])));
  }
  return hashes;
}

std::optional<hash32_t> top_level_root(const std::vector<hash32_t>& hashes) {
  auto tree = tearoff::crypto::merkle_tree::build(hashes);
  if (!tree) {
    return std::nullopt;
  }
  return tree.value().root();
}

tearoff::common::status_t rejected(const tearoff::common::error_t& error) {
  spdlog::warn("{}", error.message());
  return error;
}

bool has_signer(const signers_t& signers, const public_key_t& key) {
  return std::ranges::find(signers, key) != std::end(signers);
}

}  // namespace

filtered_transaction::filtered_transaction(
    const hash32_t& id,
    std::vector<filtered_component_group_t> filtered_component_groups,
    std::vector<hash32_t> group_hashes)
    : traversable_transaction{std::move(filtered_component_groups)},
      id_{id},
      group_hashes_{std::move(group_hashes)} {}

tearoff::common::result<filtered_transaction> filtered_transaction::make(
    const hash32_t& id,
    std::vector<filtered_component_group_t> filtered_component_groups,
    std::vector<hash32_t> group_hashes) {
  std::ranges::sort(filtered_component_groups, {},
                    &filtered_component_group_t::group_index);
  for (std::size_t i = 0; i < filtered_component_groups.size(); ++i) {
    const auto& group = filtered_component_groups[i];
    if (group.group_index > kMaxComponentGroupIndex) {
      return tearoff::common::make_malformed_error(
          fmt::format("Component group index {} exceeds the maximum of {}",
                      group.group_index, kMaxComponentGroupIndex),
          group.group_index);
    }
    if (i > 0 &&
        filtered_component_groups[i - 1].group_index == group.group_index) {
      return tearoff::common::make_malformed_error(
          "Duplicated component groups detected", group.group_index);
    }
    if (group.components.size() != group.nonces.size()) {
      return tearoff::common::make_malformed_error(
          fmt::format("Size of transaction components ({}) and nonces ({}) "
                      "do not match",
                      group.components.size(), group.nonces.size()),
          group.group_index);
    }
  }
  return filtered_transaction{id, std::move(filtered_component_groups),
                              std::move(group_hashes)};
}

tearoff::common::result<filtered_transaction> filtered_transaction::decode(
    const bytes_view_t& bytes) {
  auto envelope =
      encoder_t{}.try_decode<filtered_transaction_envelope_t>(bytes);
  if (!envelope) {
    return tearoff::common::make_malformed_error(
        "Filtered transaction envelope cannot be deserialised");
  }
  if (envelope->version != 1) {
    return tearoff::common::make_malformed_error(fmt::format(
        "Unsupported filtered transaction version {}", envelope->version));
  }
  return make(envelope->id, std::move(envelope->filtered_component_groups),
              std::move(envelope->group_hashes));
}

bytes_t filtered_transaction::encode() const {
  auto envelope = filtered_transaction_envelope_t{
      .id = id_,
      .filtered_component_groups = component_groups(),
      .group_hashes = group_hashes_};
  return encoder_t{}.encode(envelope);
}

const hash32_t& filtered_transaction::id() const {
  return id_;
}

const std::vector<filtered_component_group_t>&
filtered_transaction::filtered_component_groups() const {
  return component_groups();
}

const std::vector<hash32_t>& filtered_transaction::group_hashes() const {
  return group_hashes_;
}

tearoff::common::status_t filtered_transaction::verify() const {
  if (group_hashes_.empty()) {
    return rejected(tearoff::common::make_verification_error(
        id_, "At least one component group hash is required"));
  }
  if (top_level_root(group_hashes_) != id_) {
    return rejected(tearoff::common::make_verification_error(
        id_, "Top level Merkle tree cannot be verified against transaction's id"));
  }

  for (const auto& group : component_groups()) {
    const auto index = group.group_index;
    if (index >= group_hashes_.size()) {
      return rejected(tearoff::common::make_verification_error(
          id_,
          fmt::format("There is no matching component group hash for group {}",
                      index),
          index));
    }
    const auto& group_root = group_hashes_[index];
    auto used = std::vector<hash32_t>{};
    auto partial_root =
        tearoff::crypto::root_and_used_hashes(group.partial_tree, used);
    if (!partial_root || partial_root.value() != group_root) {
      return rejected(tearoff::common::make_verification_error(
          id_,
          fmt::format("Partial Merkle tree root and advertised full Merkle "
                      "tree root for component group {} do not match",
                      index),
          index));
    }
    if (!tearoff::crypto::verify(group.partial_tree, group_root,
                                 recompute_component_hashes(group))) {
      return rejected(tearoff::common::make_verification_error(
          id_,
          fmt::format("Visible components in group {} cannot be verified "
                      "against their partial Merkle tree",
                      index),
          index));
    }
  }
  spdlog::debug("Verified filtered transaction {} with {} revealed groups",
                to_hex(id_), component_groups().size());
  return tearoff::common::ok();
}

tearoff::common::status_t filtered_transaction::check_all_components_visible(
    const component_group_type type) const {
  return check_all_components_visible(group_index(type));
}

tearoff::common::status_t filtered_transaction::check_all_components_visible(
    const uint32_t index) const {
  const auto* group = find_group(index);
  if (group == nullptr) {
    if (index < group_hashes_.size() &&
        group_hashes_[index] != make_all_ones_hash()) {
      return rejected(tearoff::common::make_visibility_error(
          id_,
          fmt::format("Did not receive components for {} and cannot verify "
                      "that it is empty",
                      describe_group(index)),
          index));
    }
    return tearoff::common::ok();
  }

  if (index >= group_hashes_.size()) {
    return rejected(tearoff::common::make_visibility_error(
        id_,
        fmt::format("There is no matching component group hash for group {}",
                    index),
        index));
  }
  auto full_tree =
      tearoff::crypto::merkle_tree::build(recompute_component_hashes(*group));
  if (!full_tree || full_tree.value().root() != group_hashes_[index]) {
    return rejected(tearoff::common::make_visibility_error(
        id_,
        fmt::format("Some components for {} are not visible",
                    describe_group(index)),
        index));
  }
  if (top_level_root(group_hashes_) != id_) {
    return rejected(tearoff::common::make_visibility_error(
        id_,
        "Top level Merkle tree cannot be verified against transaction's id"));
  }
  return tearoff::common::ok();
}

tearoff::common::status_t filtered_transaction::check_command_visibility(
    const public_key_t& key) const {
  if (auto status = check_all_components_visible(component_group_type::signers);
      !status) {
    return status;
  }
  // The signers group is now known to be complete, so it gives the number
  // of commands the key has to sign in the original transaction.
  auto signer_sets = signers();
  if (!signer_sets) {
    return rejected(signer_sets.error());
  }
  auto revealed = commands();
  if (!revealed) {
    return rejected(revealed.error());
  }

  const auto expected = std::ranges::count_if(
      signer_sets.value(),
      [&](const signers_t& signers) { return has_signer(signers, key); });
  const auto received =
      std::ranges::count_if(revealed.value(), [&](const command_t& command) {
        return has_signer(command.signers, key);
      });
  if (expected != received) {
    return rejected(tearoff::common::make_visibility_error(
        id_,
        fmt::format("{} commands were expected, but received {}", expected,
                    received),
        group_index(component_group_type::commands)));
  }
  return tearoff::common::ok();
}

tearoff::common::result<bool> filtered_transaction::check_with_fun(
    const component_predicate_t& predicate) const {
  auto groups = available_component_groups();
  if (!groups) {
    return groups.error();
  }
  auto seen = false;
  for (const auto& group : groups.value()) {
    for (const auto& component : group) {
      if (!predicate(component)) {
        return false;
      }
      seen = true;
    }
  }
  return seen;
}

}  // namespace tearoff::transactions
