#pragma once
#include <tearoff/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tearoff::common {

enum class error_code : uint32_t {
  // Component bytes, cardinality or command/signer pairing are invalid.
  malformed_transaction = 1,
  // A filtered transaction does not prove membership under its id.
  verification_failed = 2,
  // Full disclosure was required but could not be proven.
  visibility_failed = 3,
  // A Merkle primitive was handed input it cannot work with.
  merkle_tree = 4,
};

struct error_t final {
  error_code code{error_code::malformed_transaction};
  std::string reason;
  std::optional<uint32_t> group_index{std::nullopt};
  std::optional<uint64_t> component_index{std::nullopt};
  std::optional<tearoff::schema::hash32_t> transaction_id{std::nullopt};

  std::string message() const;
};

error_t make_malformed_error(std::string reason,
                             std::optional<uint32_t> group_index = std::nullopt,
                             std::optional<uint64_t> component_index =
                                 std::nullopt);
error_t make_verification_error(const tearoff::schema::hash32_t& id,
                                std::string reason,
                                std::optional<uint32_t> group_index =
                                    std::nullopt);
error_t make_visibility_error(const tearoff::schema::hash32_t& id,
                              std::string reason,
                              std::optional<uint32_t> group_index =
                                  std::nullopt);
error_t make_merkle_error(std::string reason);

std::string_view to_string(error_code code);

}  // namespace tearoff::common
