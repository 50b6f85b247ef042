#pragma once
#include <tearoff/schema/primitives.hpp>
#include <cstdint>

// Schema type: state reference.
// Pointer to an output of an earlier transaction. Components of the inputs
// and references groups.
namespace tearoff::schema {

struct state_ref_t final {
  hash32_t transaction_id{};
  uint32_t index{};

  bool operator==(const state_ref_t&) const = default;
};

}  // namespace tearoff::schema
