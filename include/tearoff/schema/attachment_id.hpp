#pragma once
#include <tearoff/schema/primitives.hpp>

// Schema type: attachment id.
// Hash of an attachment (contract code or supporting document) the
// transaction depends on.
namespace tearoff::schema {

struct attachment_id_t final {
  hash32_t hash{};

  bool operator==(const attachment_id_t&) const = default;
};

}  // namespace tearoff::schema
