#include <tearoff/crypto/partial_merkle_tree.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <functional>
#include <set>

namespace tearoff::crypto {

namespace {

using tearoff::schema::hash32_t;
using tearoff::schema::partial_merkle_tree_t;
using tearoff::schema::partial_tree_node_kind;
using tearoff::schema::partial_tree_node_t;

partial_tree_node_t make_node(const partial_tree_node_kind kind,
                              const hash32_t& hash) {
  return partial_tree_node_t{.kind = static_cast<uint8_t>(kind), .hash = hash};
}

// Appends the pre-order encoding of the subtree rooted at (level, index).
// Returns true when at least one leaf below was included.
bool build_subtree(const merkle_tree& tree,
                   const std::size_t level,
                   const std::size_t index,
                   const std::set<hash32_t>& include,
                   std::size_t& used,
                   std::vector<partial_tree_node_t>& out) {
  const auto& hash = tree.node(level, index);
  if (level == 0) {
    if (include.contains(hash)) {
      ++used;
      out.push_back(make_node(partial_tree_node_kind::included_leaf, hash));
      return true;
    }
    out.push_back(make_node(partial_tree_node_kind::leaf, hash));
    return false;
  }

  const auto mark = out.size();
  out.push_back(
      make_node(partial_tree_node_kind::node, tearoff::schema::make_zero_hash()));
  auto left = build_subtree(tree, level - 1, index * 2, include, used, out);
  auto right = build_subtree(tree, level - 1, index * 2 + 1, include, used, out);
  if (left || right) {
    return true;
  }
  // Nothing revealed below: the subtree is represented by its hash alone.
  out.resize(mark);
  out.push_back(make_node(partial_tree_node_kind::leaf, hash));
  return false;
}

using included_leaf_visitor_t =
    std::function<void(const hash32_t& hash, uint64_t index)>;

// Walks the subtree starting at nodes[position], advancing position past it.
// `index` accumulates the path from the root, one bit per level, right = 1.
std::optional<hash32_t> walk(const std::vector<partial_tree_node_t>& nodes,
                             std::size_t& position,
                             const std::size_t depth,
                             const uint64_t index,
                             const included_leaf_visitor_t& visitor) {
  if (position >= nodes.size() || depth > kMaxPartialTreeDepth) {
    return std::nullopt;
  }
  const auto& current = nodes[position++];
  switch (static_cast<partial_tree_node_kind>(current.kind)) {
    case partial_tree_node_kind::included_leaf:
      visitor(current.hash, index);
      return current.hash;
    case partial_tree_node_kind::leaf:
      return current.hash;
    case partial_tree_node_kind::node: {
      auto left = walk(nodes, position, depth + 1, index << 1u, visitor);
      if (!left) {
        return std::nullopt;
      }
      auto right =
          walk(nodes, position, depth + 1, (index << 1u) | 1u, visitor);
      if (!right) {
        return std::nullopt;
      }
      return hash_concat(*left, *right);
    }
  }
  return std::nullopt;
}

std::optional<hash32_t> walk_tree(const partial_merkle_tree_t& tree,
                                  const included_leaf_visitor_t& visitor) {
  auto position = std::size_t{0};
  auto root = walk(tree.nodes, position, 0, 0, visitor);
  if (!root || position != tree.nodes.size()) {
    return std::nullopt;
  }
  return root;
}

}  // namespace

tearoff::common::result<partial_merkle_tree_t> build_partial_merkle_tree(
    const merkle_tree& tree,
    const std::vector<hash32_t>& include_hashes) {
  auto include = std::set<hash32_t>{std::begin(include_hashes),
                                    std::end(include_hashes)};
  auto used = std::size_t{0};
  auto out = partial_merkle_tree_t{};
  build_subtree(tree, tree.height(), 0, include, used, out.nodes);
  // Too many included hashes or different ones.
  if (used != include_hashes.size()) {
    return tearoff::common::make_merkle_error(
        fmt::format("{} of the {} provided hashes are not in the tree",
                    include_hashes.size() - std::min(used, include_hashes.size()),
                    include_hashes.size()));
  }
  return out;
}

tearoff::common::result<hash32_t> root_and_used_hashes(
    const partial_merkle_tree_t& tree,
    std::vector<hash32_t>& used_hashes) {
  auto root = walk_tree(tree, [&](const hash32_t& hash, uint64_t) {
    used_hashes.push_back(hash);
  });
  if (!root) {
    return tearoff::common::make_merkle_error(
        "partial Merkle tree node list is malformed");
  }
  return *root;
}

bool verify(const partial_merkle_tree_t& tree,
            const hash32_t& root,
            const std::vector<hash32_t>& hashes_to_check) {
  auto used_hashes = std::vector<hash32_t>{};
  auto verify_root = root_and_used_hashes(tree, used_hashes);
  if (!verify_root || verify_root.value() != root) {
    return false;
  }
  // Obtained the same number of hashes (leaves) and the same elements.
  if (used_hashes.size() != hashes_to_check.size()) {
    return false;
  }
  auto expected = std::set<hash32_t>{std::begin(hashes_to_check),
                                     std::end(hashes_to_check)};
  return std::ranges::all_of(used_hashes, [&](const hash32_t& hash) {
    return expected.contains(hash);
  });
}

std::optional<uint64_t> leaf_index(const partial_merkle_tree_t& tree,
                                   const hash32_t& leaf) {
  auto found = std::optional<uint64_t>{};
  auto root = walk_tree(tree, [&](const hash32_t& hash, const uint64_t index) {
    if (!found && hash == leaf) {
      found = index;
    }
  });
  if (!root) {
    return std::nullopt;
  }
  return found;
}

}  // namespace tearoff::crypto
