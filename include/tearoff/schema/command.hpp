#pragma once
#include <tearoff/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: command.
// A command is never stored as one component. Its payload lives in the
// commands group and its required signers in the signers group at the same
// original position; command_t is the reconstructed pair.
namespace tearoff::schema {

struct command_data_t final {
  std::string contract;
  std::string name;
  bytes_t parameters;

  bool operator==(const command_data_t&) const = default;
};

using signers_t = std::vector<public_key_t>;

struct command_t final {
  command_data_t data;
  signers_t signers;

  bool operator==(const command_t&) const = default;
};

}  // namespace tearoff::schema
