#pragma once
#include <tearoff/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: partial Merkle tree.
// Pre-order node list. An included leaf is a revealed component hash, a
// leaf is the hash of a pruned subtree, a node combines the two subtrees
// that follow it in the list.
namespace tearoff::schema {

enum class partial_tree_node_kind : uint8_t {
  included_leaf = 0,
  leaf = 1,
  node = 2
};

struct partial_tree_node_t final {
  uint8_t kind{};  // partial_tree_node_kind
  hash32_t hash{};  // zero for node entries

  bool operator==(const partial_tree_node_t&) const = default;
};

struct partial_merkle_tree_t final {
  std::vector<partial_tree_node_t> nodes;

  bool operator==(const partial_merkle_tree_t&) const = default;
};

}  // namespace tearoff::schema
