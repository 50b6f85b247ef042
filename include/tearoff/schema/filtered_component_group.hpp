#pragma once
#include <tearoff/schema/partial_merkle_tree.hpp>
#include <tearoff/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: filtered component group.
// Revealed subset of a component group, with the nonce of every revealed
// component (same order, same count) and the partial tree proving them
// against the group's root.
namespace tearoff::schema {

struct filtered_component_group_t final {
  uint32_t group_index{};
  std::vector<bytes_t> components;
  std::vector<hash32_t> nonces;
  partial_merkle_tree_t partial_tree;

  bool operator==(const filtered_component_group_t&) const = default;
};

}  // namespace tearoff::schema
