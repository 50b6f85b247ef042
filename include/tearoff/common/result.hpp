#pragma once
#include <tearoff/common/error.hpp>
#include <utility>
#include <variant>

namespace tearoff::common {

/// Value or error_t. Every fallible library call returns one of these; the
/// library never throws across its API.
template <typename T>
class result final {
 public:
  result(T value) : data_{std::move(value)} {}
  result(error_t error) : data_{std::move(error)} {}

  bool has_value() const { return std::holds_alternative<T>(data_); }
  bool has_error() const { return std::holds_alternative<error_t>(data_); }
  explicit operator bool() const { return has_value(); }

  T& value() & { return std::get<T>(data_); }
  const T& value() const& { return std::get<T>(data_); }
  T&& value() && { return std::get<T>(std::move(data_)); }

  const error_t& error() const { return std::get<error_t>(data_); }

 private:
  std::variant<T, error_t> data_;
};

using status_t = result<std::monostate>;

inline status_t ok() {
  return std::monostate{};
}

}  // namespace tearoff::common
