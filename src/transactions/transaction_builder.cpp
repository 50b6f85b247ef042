#include <tearoff/crypto/commitment.hpp>
#include <tearoff/schema/component_group_type.hpp>
#include <tearoff/schema/encoding/scale/encoder.hpp>
#include <tearoff/transactions/transaction_builder.hpp>

#include <utility>

using namespace tearoff::schema;

namespace tearoff::transactions {

namespace {

using encoder_t = tearoff::schema::encoding::encoder<
    tearoff::schema::encoding::scale_encoder_tag>;

template <typename T>
void append(std::map<uint32_t, std::vector<bytes_t>>& groups,
            const component_group_type type,
            const T& value) {
  groups[group_index(type)].push_back(encoder_t{}.encode(value));
}

template <typename T>
void replace(std::map<uint32_t, std::vector<bytes_t>>& groups,
             const component_group_type type,
             const T& value) {
  groups[group_index(type)] = std::vector<bytes_t>{encoder_t{}.encode(value)};
}

}  // namespace

transaction_builder& transaction_builder::add_input(const state_ref_t& input) {
  append(groups_, component_group_type::inputs, input);
  return *this;
}

transaction_builder& transaction_builder::add_output(
    const transaction_state_t& output) {
  append(groups_, component_group_type::outputs, output);
  return *this;
}

transaction_builder& transaction_builder::add_command(
    const command_data_t& data,
    const signers_t& signers) {
  append(groups_, component_group_type::commands, data);
  append(groups_, component_group_type::signers, signers);
  return *this;
}

transaction_builder& transaction_builder::add_attachment(
    const attachment_id_t& attachment) {
  append(groups_, component_group_type::attachments, attachment);
  return *this;
}

transaction_builder& transaction_builder::set_notary(const party_t& notary) {
  replace(groups_, component_group_type::notary, notary);
  return *this;
}

transaction_builder& transaction_builder::set_time_window(
    const time_window_t& time_window) {
  replace(groups_, component_group_type::time_window, time_window);
  return *this;
}

transaction_builder& transaction_builder::add_reference(
    const state_ref_t& reference) {
  append(groups_, component_group_type::references, reference);
  return *this;
}

transaction_builder& transaction_builder::add_unknown_component(
    const uint32_t group_index,
    bytes_t bytes) {
  groups_[group_index].push_back(std::move(bytes));
  return *this;
}

std::vector<component_group_t> transaction_builder::component_groups() const {
  auto out = std::vector<component_group_t>{};
  out.reserve(groups_.size());
  for (const auto& [index, components] : groups_) {
    out.push_back(component_group_t{.group_index = index,
                                    .components = components});
  }
  return out;
}

tearoff::common::result<wire_transaction>
transaction_builder::to_wire_transaction(const hash32_t& privacy_salt) const {
  return wire_transaction::make(component_groups(), privacy_salt);
}

tearoff::common::result<wire_transaction>
transaction_builder::to_wire_transaction() const {
  return to_wire_transaction(tearoff::crypto::make_privacy_salt());
}

}  // namespace tearoff::transactions
