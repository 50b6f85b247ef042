#include <tearoff/common/critical.hpp>
#include <tearoff/transactions/component_cache.hpp>

#include <utility>

namespace tearoff::transactions {

component_cache::component_cache(const std::vector<std::size_t>& group_sizes) {
  slots_.reserve(group_sizes.size());
  for (const auto size : group_sizes) {
    slots_.emplace_back(size);
  }
}

std::optional<tearoff::schema::decoded_component_t> component_cache::find(
    const std::size_t slot,
    const std::size_t index) const {
  auto lock = std::scoped_lock{mutex_};
  if (slot >= slots_.size() || index >= slots_[slot].size()) {
    tearoff::common::critical("component cache lookup out of range");
  }
  return slots_[slot][index];
}

tearoff::schema::decoded_component_t component_cache::store(
    const std::size_t slot,
    const std::size_t index,
    tearoff::schema::decoded_component_t value) {
  auto lock = std::scoped_lock{mutex_};
  if (slot >= slots_.size() || index >= slots_[slot].size()) {
    tearoff::common::critical("component cache store out of range");
  }
  auto& entry = slots_[slot][index];
  if (!entry) {
    entry = std::move(value);
  }
  return *entry;
}

}  // namespace tearoff::transactions
