#pragma once
#include <tearoff/schema/primitives.hpp>
#include <cstdint>

namespace tearoff::crypto {

/// Per-component salt:
/// BLAKE3(BLAKE3(privacy_salt || be32(group) || be32(index))).
/// Keeps low-entropy components (a notary, a time window) from being
/// recovered from their hash by brute force.
tearoff::schema::hash32_t compute_nonce(
    const tearoff::schema::hash32_t& privacy_salt,
    uint32_t group_index,
    uint32_t internal_index);

/// BLAKE3(BLAKE3(nonce || serialized component)). The leaf of a group's
/// Merkle tree. Hashed twice so that no (nonce, component) pair can pass for
/// an interior node, which hash_concat computes with a single BLAKE3.
tearoff::schema::hash32_t component_hash(
    const tearoff::schema::hash32_t& nonce,
    const tearoff::schema::bytes_view_t& serialized_component);

/// 32 random bytes from the OpenSSL CSPRNG, never all zero.
tearoff::schema::hash32_t make_privacy_salt();

}  // namespace tearoff::crypto
