#include <tearoff/schema/component_group_type.hpp>
#include <tearoff/schema/enum_string.hpp>

#include <array>
#include <utility>

namespace tearoff::schema {

namespace {

constexpr auto kGroupNames =
    std::array<std::pair<std::string_view, component_group_type>,
               kKnownComponentGroupCount>{
        std::pair{std::string_view{"inputs"}, component_group_type::inputs},
        std::pair{std::string_view{"outputs"}, component_group_type::outputs},
        std::pair{std::string_view{"commands"},
                  component_group_type::commands},
        std::pair{std::string_view{"attachments"},
                  component_group_type::attachments},
        std::pair{std::string_view{"notary"}, component_group_type::notary},
        std::pair{std::string_view{"time_window"},
                  component_group_type::time_window},
        std::pair{std::string_view{"signers"}, component_group_type::signers},
        std::pair{std::string_view{"references"},
                  component_group_type::references}};

}  // namespace

std::optional<component_group_type> try_component_group_type(
    const uint32_t index) {
  if (!is_known_group(index)) {
    return std::nullopt;
  }
  return static_cast<component_group_type>(index);
}

std::optional<component_group_type> component_group_type_from_string(
    const std::string_view name) {
  return from_string(name, kGroupNames);
}

std::string_view to_string(const component_group_type type) {
  return to_string(type, kGroupNames).value_or("unknown");
}

std::string describe_group(const uint32_t index) {
  auto type = try_component_group_type(index);
  if (!type) {
    return "group " + std::to_string(index);
  }
  return std::string{to_string(*type)} + " group";
}

}  // namespace tearoff::schema
