#include <tearoff/common/critical.hpp>
#include <tearoff/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace tearoff::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

// FNV-1a over the key bytes; keys are uniformly distributed already.
size_t hash_key_bytes(const uint8_t* data, const size_t size) {
  auto value = size_t{1469598103934665603ull};
  for (size_t i = 0; i < size; ++i) {
    value ^= data[i];
    value *= size_t{1099511628211ull};
  }
  return value;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const hash32_t& hash) {
  return bytes_view_t{hash.data(), hash.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    tearoff::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    tearoff::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

hash32_t make_all_ones_hash() {
  auto hash = hash32_t{};
  hash.fill(0xFF);
  return hash;
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(make_bytes_view(hash));
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded.has_value()) {
    tearoff::common::critical("invalid hex input");
  }
  return *decoded;
}

std::optional<public_key_t> try_make_public_key(const bytes_view_t& bytes) {
  if (bytes.size() == 32) {
    auto key = ed25519_public_key_t{};
    std::copy_n(bytes.data(), key.public_key.size(), key.public_key.data());
    return key;
  }
  if (bytes.size() == 33 && (bytes[0] == 0x02 || bytes[0] == 0x03)) {
    auto key = secp256k1_public_key_t{};
    std::copy_n(bytes.data(), key.public_key.size(), key.public_key.data());
    return key;
  }
  return std::nullopt;
}

bytes_view_t public_key_bytes(const public_key_t& key) {
  return std::visit(
      [](const auto& value) {
        return bytes_view_t{value.public_key.data(), value.public_key.size()};
      },
      key);
}

}  // namespace tearoff::schema

namespace std {

size_t hash<tearoff::schema::ed25519_public_key_t>::operator()(
    const tearoff::schema::ed25519_public_key_t& key) const noexcept {
  return tearoff::schema::hash_key_bytes(key.public_key.data(),
                                         key.public_key.size());
}

size_t hash<tearoff::schema::secp256k1_public_key_t>::operator()(
    const tearoff::schema::secp256k1_public_key_t& key) const noexcept {
  return tearoff::schema::hash_key_bytes(key.public_key.data(),
                                         key.public_key.size());
}

}  // namespace std
