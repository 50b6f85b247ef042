#pragma once
#include <tearoff/common/result.hpp>
#include <tearoff/schema/primitives.hpp>
#include <cstddef>
#include <vector>

namespace tearoff::crypto {

/// BLAKE3(left || right); the node hash of every Merkle tree in a
/// transaction.
tearoff::schema::hash32_t hash_concat(const tearoff::schema::hash32_t& left,
                                      const tearoff::schema::hash32_t& right);

/// Full binary Merkle tree over an ordered list of leaf hashes.
///
/// Leaves are padded with the zero hash up to the next power of two, so the
/// tree is always complete. A single leaf is its own root.
class merkle_tree final {
 public:
  /// Fails with error_code::merkle_tree on an empty leaf list.
  static tearoff::common::result<merkle_tree> build(
      const std::vector<tearoff::schema::hash32_t>& leaves);

  const tearoff::schema::hash32_t& root() const;

  /// Number of leaves before padding.
  std::size_t leaf_count() const;

  /// Number of levels above the leaves (0 for a single leaf).
  std::size_t height() const;

  /// Level 0 holds the padded leaves; level height() holds the root.
  const tearoff::schema::hash32_t& node(std::size_t level,
                                        std::size_t index) const;

 private:
  merkle_tree(std::vector<std::vector<tearoff::schema::hash32_t>> levels,
              std::size_t leaf_count);

  std::vector<std::vector<tearoff::schema::hash32_t>> levels_;
  std::size_t leaf_count_{};
};

}  // namespace tearoff::crypto
