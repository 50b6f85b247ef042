#pragma once
#include <tearoff/schema/attachment_id.hpp>
#include <tearoff/schema/command.hpp>
#include <tearoff/schema/party.hpp>
#include <tearoff/schema/primitives.hpp>
#include <tearoff/schema/state_ref.hpp>
#include <tearoff/schema/time_window.hpp>
#include <tearoff/schema/transaction_state.hpp>
#include <cstdint>
#include <functional>
#include <variant>

// Schema type: component.
// Typed view of one revealed or revealable component, as seen by filtering
// predicates and check_with_fun. Components of groups this version does not
// know are handed over as raw bytes.
namespace tearoff::schema {

struct opaque_component_t final {
  uint32_t group_index{};
  bytes_t bytes;

  bool operator==(const opaque_component_t&) const = default;
};

using component_t = std::variant<state_ref_t,
                                 transaction_state_t,
                                 command_t,
                                 attachment_id_t,
                                 party_t,
                                 time_window_t,
                                 opaque_component_t>;

using component_predicate_t = std::function<bool(const component_t&)>;

// What a single component decodes to, before commands are paired with
// their signers.
using decoded_component_t = std::variant<state_ref_t,
                                         transaction_state_t,
                                         command_data_t,
                                         attachment_id_t,
                                         party_t,
                                         time_window_t,
                                         signers_t>;

}  // namespace tearoff::schema
