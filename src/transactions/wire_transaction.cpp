#include <tearoff/crypto/commitment.hpp>
#include <tearoff/schema/component_group_type.hpp>
#include <tearoff/schema/encoding/scale/encoder.hpp>
#include <tearoff/schema/envelope.hpp>
#include <tearoff/transactions/wire_transaction.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

using namespace tearoff::schema;

namespace tearoff::transactions {

namespace {

using encoder_t = tearoff::schema::encoding::encoder<
    tearoff::schema::encoding::scale_encoder_tag>;

tearoff::common::status_t validate_groups(
    const std::vector<component_group_t>& sorted_groups,
    const hash32_t& privacy_salt) {
  if (sorted_groups.empty()) {
    return tearoff::common::make_malformed_error(
        "A transaction must contain at least one component group");
  }
  if (privacy_salt == make_zero_hash()) {
    return tearoff::common::make_malformed_error(
        "Privacy salt must not be all zeros");
  }
  for (std::size_t i = 0; i < sorted_groups.size(); ++i) {
    const auto& group = sorted_groups[i];
    if (group.group_index > kMaxComponentGroupIndex) {
      return tearoff::common::make_malformed_error(
          fmt::format("Component group index {} exceeds the maximum of {}",
                      group.group_index, kMaxComponentGroupIndex),
          group.group_index);
    }
    if (i > 0 && sorted_groups[i - 1].group_index == group.group_index) {
      return tearoff::common::make_malformed_error(
          "Duplicated component groups detected", group.group_index);
    }
    if (group.components.empty()) {
      return tearoff::common::make_malformed_error(
          "Empty component groups are not allowed", group.group_index);
    }
  }
  return tearoff::common::ok();
}

tearoff::common::result<group_commitment_t> commit_group(
    const component_group_t& group,
    const hash32_t& privacy_salt) {
  auto nonces = std::vector<hash32_t>{};
  auto hashes = std::vector<hash32_t>{};
  nonces.reserve(group.components.size());
  hashes.reserve(group.components.size());
  for (std::size_t i = 0; i < group.components.size(); ++i) {
    auto nonce = tearoff::crypto::compute_nonce(privacy_salt, group.group_index,
                                                static_cast<uint32_t>(i));
    hashes.push_back(tearoff::crypto::component_hash(
        nonce, make_bytes_view(group.components[i])));
    nonces.push_back(nonce);
  }
  auto tree = tearoff::crypto::merkle_tree::build(hashes);
  if (!tree) {
    return tree.error();
  }
  return group_commitment_t{.nonces = std::move(nonces),
                            .component_hashes = std::move(hashes),
                            .tree = std::move(tree).value()};
}

}  // namespace

wire_transaction::wire_transaction(
    std::vector<component_group_t> component_groups,
    const hash32_t& privacy_salt,
    std::vector<std::optional<group_commitment_t>> commitments,
    std::vector<hash32_t> group_hashes,
    const hash32_t& id)
    : traversable_transaction{std::move(component_groups)},
      privacy_salt_{privacy_salt},
      commitments_{std::move(commitments)},
      group_hashes_{std::move(group_hashes)},
      id_{id} {}

tearoff::common::result<wire_transaction> wire_transaction::make(
    std::vector<component_group_t> component_groups,
    const hash32_t& privacy_salt) {
  std::ranges::sort(component_groups, {}, &component_group_t::group_index);
  if (auto status = validate_groups(component_groups, privacy_salt); !status) {
    spdlog::warn("Rejected wire transaction: {}", status.error().message());
    return status.error();
  }

  const auto hash_count = std::max<std::size_t>(
      kKnownComponentGroupCount, component_groups.back().group_index + 1);
  auto group_hashes = std::vector<hash32_t>(hash_count, make_all_ones_hash());
  auto commitments = std::vector<std::optional<group_commitment_t>>(hash_count);
  for (const auto& group : component_groups) {
    auto commitment = commit_group(group, privacy_salt);
    if (!commitment) {
      return commitment.error();
    }
    group_hashes[group.group_index] = commitment.value().tree.root();
    commitments[group.group_index] = std::move(commitment).value();
  }

  auto top = tearoff::crypto::merkle_tree::build(group_hashes);
  if (!top) {
    return top.error();
  }
  auto id = top.value().root();

  auto transaction =
      wire_transaction{std::move(component_groups), privacy_salt,
                       std::move(commitments), std::move(group_hashes), id};
  if (auto status = transaction.check_invariants(); !status) {
    spdlog::warn("Rejected wire transaction {}: {}", to_hex(id),
                 status.error().message());
    return status.error();
  }
  spdlog::debug("Built wire transaction {} with {} component groups",
                to_hex(id), transaction.component_groups().size());
  return transaction;
}

tearoff::common::result<wire_transaction> wire_transaction::decode(
    const bytes_view_t& bytes) {
  auto envelope = encoder_t{}.try_decode<wire_transaction_envelope_t>(bytes);
  if (!envelope) {
    return tearoff::common::make_malformed_error(
        "Wire transaction envelope cannot be deserialised");
  }
  if (envelope->version != 1) {
    return tearoff::common::make_malformed_error(fmt::format(
        "Unsupported wire transaction version {}", envelope->version));
  }
  return make(std::move(envelope->component_groups), envelope->privacy_salt);
}

bytes_t wire_transaction::encode() const {
  auto envelope = wire_transaction_envelope_t{
      .component_groups = component_groups(), .privacy_salt = privacy_salt_};
  return encoder_t{}.encode(envelope);
}

const hash32_t& wire_transaction::id() const {
  return id_;
}

const hash32_t& wire_transaction::privacy_salt() const {
  return privacy_salt_;
}

const std::vector<hash32_t>& wire_transaction::group_hashes() const {
  return group_hashes_;
}

const group_commitment_t* wire_transaction::commitment(
    const uint32_t group_index) const {
  if (group_index >= commitments_.size() || !commitments_[group_index]) {
    return nullptr;
  }
  return &*commitments_[group_index];
}

}  // namespace tearoff::transactions
