#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tearoff::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using timestamp_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const hash32_t& hash);
bytes_view_t make_bytes_view(const std::string_view& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);

// Merkle padding leaf.
hash32_t make_zero_hash();
// Group hash of a component group absent from a transaction.
hash32_t make_all_ones_hash();

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

struct ed25519_public_key_t final {
  std::array<uint8_t, 32> public_key{};

  bool operator==(const ed25519_public_key_t&) const = default;
};

struct secp256k1_public_key_t final {
  std::array<uint8_t, 33> public_key{};  // compressed SEC1 point

  bool operator==(const secp256k1_public_key_t&) const = default;
};

using public_key_t = std::variant<ed25519_public_key_t, secp256k1_public_key_t>;

std::optional<public_key_t> try_make_public_key(const bytes_view_t& bytes);
bytes_view_t public_key_bytes(const public_key_t& key);

}  // namespace tearoff::schema

namespace std {

template <>
struct hash<tearoff::schema::ed25519_public_key_t> {
  size_t operator()(
      const tearoff::schema::ed25519_public_key_t& key) const noexcept;
};

template <>
struct hash<tearoff::schema::secp256k1_public_key_t> {
  size_t operator()(
      const tearoff::schema::secp256k1_public_key_t& key) const noexcept;
};

}  // namespace std
