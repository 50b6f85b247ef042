#pragma once
#include <tearoff/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: component group.
// Ordered serialized components of one kind. At most one group per index
// exists in a transaction.
namespace tearoff::schema {

struct component_group_t final {
  uint32_t group_index{};
  std::vector<bytes_t> components;

  bool operator==(const component_group_t&) const = default;
};

}  // namespace tearoff::schema
