#include <tearoff/blake3/hash.hpp>
#include <tearoff/common/critical.hpp>
#include <tearoff/crypto/commitment.hpp>

#include <boost/endian/buffers.hpp>
#include <openssl/rand.h>

#include <algorithm>
#include <initializer_list>

namespace tearoff::crypto {

namespace {

// BLAKE3(BLAKE3(parts)). The outer input is 32 bytes and an interior node's
// is 64, so a leaf can only equal a node on a BLAKE3 collision.
tearoff::schema::hash32_t hash_twice(
    std::initializer_list<tearoff::schema::bytes_view_t> parts) {
  auto inner = tearoff::blake3::hash(parts);
  return tearoff::blake3::hash(tearoff::schema::make_bytes_view(inner));
}

}  // namespace

tearoff::schema::hash32_t compute_nonce(
    const tearoff::schema::hash32_t& privacy_salt,
    const uint32_t group_index,
    const uint32_t internal_index) {
  auto group = boost::endian::big_uint32_buf_t{group_index};
  auto index = boost::endian::big_uint32_buf_t{internal_index};
  return hash_twice(
      {tearoff::schema::make_bytes_view(privacy_salt),
       tearoff::schema::bytes_view_t{
           reinterpret_cast<const uint8_t*>(group.data()), sizeof(group)},
       tearoff::schema::bytes_view_t{
           reinterpret_cast<const uint8_t*>(index.data()), sizeof(index)}});
}

tearoff::schema::hash32_t component_hash(
    const tearoff::schema::hash32_t& nonce,
    const tearoff::schema::bytes_view_t& serialized_component) {
  return hash_twice(
      {tearoff::schema::make_bytes_view(nonce), serialized_component});
}

tearoff::schema::hash32_t make_privacy_salt() {
  auto salt = tearoff::schema::hash32_t{};
  do {
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
      tearoff::common::critical("OpenSSL RAND_bytes failed");
    }
  } while (std::ranges::all_of(salt, [](const uint8_t b) { return b == 0; }));
  return salt;
}

}  // namespace tearoff::crypto
