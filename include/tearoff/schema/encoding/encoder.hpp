#pragma once
#include <tearoff/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tearoff::schema::encoding {

// Serialization backend is a build time choice: each backend specializes
// encoder<Tag> and callers name the tag through an alias, e.g.
//   using encoder_t = encoder<scale_encoder_tag>;
// Components are committed to as encoded bytes, so switching backends
// changes every transaction id.
template <typename Library>
struct encoder {
  template <typename T>
  tearoff::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tearoff::schema::bytes_t& out);

  template <typename T>
  T decode(const tearoff::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tearoff::schema::bytes_view_t& bytes);
};

}  // namespace tearoff::schema::encoding
