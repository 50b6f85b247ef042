#pragma once
#include <tearoff/schema/primitives.hpp>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>

namespace tearoff::blake3 {

tearoff::schema::hash32_t hash(const std::string_view& str);
tearoff::schema::hash32_t hash(const tearoff::schema::bytes_view_t& bytes);

// Hash of the concatenation of several byte ranges, without copying them
// into one buffer first.
tearoff::schema::hash32_t hash(
    std::initializer_list<tearoff::schema::bytes_view_t> parts);

}  // namespace tearoff::blake3
