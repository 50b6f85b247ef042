#pragma once
#include <tearoff/common/result.hpp>
#include <tearoff/crypto/merkle_tree.hpp>
#include <tearoff/schema/partial_merkle_tree.hpp>
#include <tearoff/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <vector>

// Partial Merkle trees prove that a subset of leaves belongs to a full tree
// with a known root, revealing only the hashes of the pruned subtrees.
namespace tearoff::crypto {

/// Deepest partial tree accepted from the wire. Deeper trees cannot come out
/// of a transaction and are rejected before recursion gets expensive.
inline constexpr auto kMaxPartialTreeDepth = std::size_t{64};

/// Keep every leaf of `tree` listed in `include_hashes`, collapse every
/// subtree without one into a single leaf. Fails if any include hash is not
/// a leaf of the tree, or is listed twice.
tearoff::common::result<tearoff::schema::partial_merkle_tree_t>
build_partial_merkle_tree(
    const merkle_tree& tree,
    const std::vector<tearoff::schema::hash32_t>& include_hashes);

/// Recompute the root; included leaf hashes are appended to `used_hashes` in
/// leaf order. Fails on a structurally invalid node list.
tearoff::common::result<tearoff::schema::hash32_t> root_and_used_hashes(
    const tearoff::schema::partial_merkle_tree_t& tree,
    std::vector<tearoff::schema::hash32_t>& used_hashes);

/// True when the recomputed root equals `root` and the included leaves are
/// exactly `hashes_to_check`.
bool verify(const tearoff::schema::partial_merkle_tree_t& tree,
            const tearoff::schema::hash32_t& root,
            const std::vector<tearoff::schema::hash32_t>& hashes_to_check);

/// Position of an included leaf in the original full tree.
std::optional<uint64_t> leaf_index(
    const tearoff::schema::partial_merkle_tree_t& tree,
    const tearoff::schema::hash32_t& leaf);

}  // namespace tearoff::crypto
