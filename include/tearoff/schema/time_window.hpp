#pragma once
#include <tearoff/schema/primitives.hpp>
#include <optional>

// Schema type: time window.
// Validity interval of a transaction; either bound may be open.
namespace tearoff::schema {

struct time_window_t final {
  std::optional<timestamp_milliseconds_t> from_ms{std::nullopt};
  std::optional<timestamp_milliseconds_t> until_ms{std::nullopt};

  bool operator==(const time_window_t&) const = default;
};

}  // namespace tearoff::schema
