#pragma once
#include <tearoff/schema/component.hpp>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace tearoff::transactions {

/// Decoded components of one transaction, addressed by (slot, index) where
/// slot is the position of the group in the transaction's group list.
///
/// Each entry is written at most once. Two threads decoding the same
/// component race harmlessly: the first store wins and both callers get the
/// stored value.
class component_cache final {
 public:
  explicit component_cache(const std::vector<std::size_t>& group_sizes);

  std::optional<tearoff::schema::decoded_component_t> find(
      std::size_t slot,
      std::size_t index) const;

  tearoff::schema::decoded_component_t store(
      std::size_t slot,
      std::size_t index,
      tearoff::schema::decoded_component_t value);

 private:
  mutable std::mutex mutex_;
  std::vector<std::vector<std::optional<tearoff::schema::decoded_component_t>>>
      slots_;
};

}  // namespace tearoff::transactions
