#include <tearoff/blake3/hash.hpp>
#include <tearoff/crypto/merkle_tree.hpp>

#include <utility>

namespace tearoff::crypto {

tearoff::schema::hash32_t hash_concat(const tearoff::schema::hash32_t& left,
                                      const tearoff::schema::hash32_t& right) {
  return tearoff::blake3::hash({tearoff::schema::make_bytes_view(left),
                                tearoff::schema::make_bytes_view(right)});
}

tearoff::common::result<merkle_tree> merkle_tree::build(
    const std::vector<tearoff::schema::hash32_t>& leaves) {
  if (leaves.empty()) {
    return tearoff::common::make_merkle_error(
        "cannot calculate Merkle root on empty hash list");
  }

  auto width = std::size_t{1};
  while (width < leaves.size()) {
    width <<= 1u;
  }

  auto levels = std::vector<std::vector<tearoff::schema::hash32_t>>{};
  auto& bottom = levels.emplace_back(leaves);
  bottom.resize(width, tearoff::schema::make_zero_hash());

  while (levels.back().size() > 1) {
    const auto& below = levels.back();
    auto above = std::vector<tearoff::schema::hash32_t>{};
    above.reserve(below.size() / 2);
    for (std::size_t i = 0; i < below.size(); i += 2) {
      above.push_back(hash_concat(below[i], below[i + 1]));
    }
    levels.push_back(std::move(above));
  }
  return merkle_tree{std::move(levels), leaves.size()};
}

merkle_tree::merkle_tree(
    std::vector<std::vector<tearoff::schema::hash32_t>> levels,
    const std::size_t leaf_count)
    : levels_{std::move(levels)}, leaf_count_{leaf_count} {}

const tearoff::schema::hash32_t& merkle_tree::root() const {
  return levels_.back().front();
}

std::size_t merkle_tree::leaf_count() const {
  return leaf_count_;
}

std::size_t merkle_tree::height() const {
  return levels_.size() - 1;
}

const tearoff::schema::hash32_t& merkle_tree::node(
    const std::size_t level,
    const std::size_t index) const {
  return levels_.at(level).at(index);
}

}  // namespace tearoff::crypto
