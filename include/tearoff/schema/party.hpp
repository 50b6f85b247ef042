#pragma once
#include <tearoff/schema/primitives.hpp>
#include <string>

// Schema type: party.
// Named well-known identity. The notary group holds at most one.
namespace tearoff::schema {

struct party_t final {
  std::string name;
  public_key_t owning_key{};

  bool operator==(const party_t&) const = default;
};

}  // namespace tearoff::schema
