#include <tearoff/common/error.hpp>

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace tearoff::common {

std::string error_t::message() const {
  auto id = transaction_id ? tearoff::schema::to_hex(*transaction_id)
                           : std::string{"<unknown>"};
  switch (code) {
    case error_code::verification_failed:
      return fmt::format("Transaction with id:{} cannot be verified. Reason: {}",
                         id, reason);
    case error_code::visibility_failed:
      return fmt::format(
          "Component visibility error for transaction with id:{}. Reason: {}",
          id, reason);
    case error_code::merkle_tree:
      return fmt::format("Merkle tree error: {}", reason);
    case error_code::malformed_transaction:
      break;
  }
  if (group_index && component_index) {
    return fmt::format("Malformed transaction, group {} at index {}: {}",
                       *group_index, *component_index, reason);
  }
  if (group_index) {
    return fmt::format("Malformed transaction, group {}: {}", *group_index,
                       reason);
  }
  return fmt::format("Malformed transaction: {}", reason);
}

error_t make_malformed_error(std::string reason,
                             std::optional<uint32_t> group_index,
                             std::optional<uint64_t> component_index) {
  return error_t{.code = error_code::malformed_transaction,
                 .reason = std::move(reason),
                 .group_index = group_index,
                 .component_index = component_index};
}

error_t make_verification_error(const tearoff::schema::hash32_t& id,
                                std::string reason,
                                std::optional<uint32_t> group_index) {
  return error_t{.code = error_code::verification_failed,
                 .reason = std::move(reason),
                 .group_index = group_index,
                 .transaction_id = id};
}

error_t make_visibility_error(const tearoff::schema::hash32_t& id,
                              std::string reason,
                              std::optional<uint32_t> group_index) {
  return error_t{.code = error_code::visibility_failed,
                 .reason = std::move(reason),
                 .group_index = group_index,
                 .transaction_id = id};
}

error_t make_merkle_error(std::string reason) {
  return error_t{.code = error_code::merkle_tree, .reason = std::move(reason)};
}

std::string_view to_string(const error_code code) {
  switch (code) {
    case error_code::malformed_transaction:
      return "malformed_transaction";
    case error_code::verification_failed:
      return "verification_failed";
    case error_code::visibility_failed:
      return "visibility_failed";
    case error_code::merkle_tree:
      return "merkle_tree";
  }
  return "unknown";
}

}  // namespace tearoff::common
