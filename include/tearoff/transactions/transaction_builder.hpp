#pragma once
#include <tearoff/common/result.hpp>
#include <tearoff/schema/attachment_id.hpp>
#include <tearoff/schema/command.hpp>
#include <tearoff/schema/component_group.hpp>
#include <tearoff/schema/party.hpp>
#include <tearoff/schema/state_ref.hpp>
#include <tearoff/schema/time_window.hpp>
#include <tearoff/schema/transaction_state.hpp>
#include <tearoff/transactions/wire_transaction.hpp>
#include <cstdint>
#include <map>

namespace tearoff::transactions {

/// Serializes typed components into their groups. A command's payload goes
/// to the commands group and its signers to the signers group at the same
/// position.
class transaction_builder final {
 public:
  transaction_builder& add_input(const tearoff::schema::state_ref_t& input);
  transaction_builder& add_output(
      const tearoff::schema::transaction_state_t& output);
  transaction_builder& add_command(const tearoff::schema::command_data_t& data,
                                   const tearoff::schema::signers_t& signers);
  transaction_builder& add_attachment(
      const tearoff::schema::attachment_id_t& attachment);
  transaction_builder& set_notary(const tearoff::schema::party_t& notary);
  transaction_builder& set_time_window(
      const tearoff::schema::time_window_t& time_window);
  transaction_builder& add_reference(
      const tearoff::schema::state_ref_t& reference);

  /// Raw component for a group index this version does not interpret.
  transaction_builder& add_unknown_component(uint32_t group_index,
                                             tearoff::schema::bytes_t bytes);

  std::vector<tearoff::schema::component_group_t> component_groups() const;

  tearoff::common::result<wire_transaction> to_wire_transaction(
      const tearoff::schema::hash32_t& privacy_salt) const;
  /// Same, with a fresh random privacy salt.
  tearoff::common::result<wire_transaction> to_wire_transaction() const;

 private:
  std::map<uint32_t, std::vector<tearoff::schema::bytes_t>> groups_;
};

}  // namespace tearoff::transactions
