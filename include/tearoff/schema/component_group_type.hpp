#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: component group type.
// Discriminant of each component group inside a transaction. The numeric
// values are part of the commitment: a group's root hash sits at position
// `group_index` of the top-level Merkle tree.
namespace tearoff::schema {

enum class component_group_type : uint32_t {
  inputs = 0,
  outputs = 1,
  commands = 2,
  attachments = 3,
  notary = 4,
  time_window = 5,
  signers = 6,
  references = 7
};

inline constexpr auto kKnownComponentGroupCount = uint32_t{8};
inline constexpr auto kMaxComponentGroupIndex = uint32_t{1023};

constexpr uint32_t group_index(const component_group_type type) {
  return static_cast<uint32_t>(type);
}

constexpr bool is_known_group(const uint32_t index) {
  return index < kKnownComponentGroupCount;
}

std::optional<component_group_type> try_component_group_type(uint32_t index);
std::optional<component_group_type> component_group_type_from_string(
    std::string_view name);
std::string_view to_string(component_group_type type);

// "inputs group" for known groups, "group <n>" otherwise.
std::string describe_group(uint32_t index);

}  // namespace tearoff::schema
