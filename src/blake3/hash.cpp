#include <blake3.h>
#include <tearoff/blake3/hash.hpp>

namespace tearoff::blake3 {

namespace {

// blake3_hasher holds no heap state, so there is nothing to release.
class hasher final {
 public:
  hasher() { blake3_hasher_init(&state_); }

  void update(const tearoff::schema::bytes_view_t& bytes) {
    blake3_hasher_update(&state_, bytes.data(), bytes.size());
  }

  tearoff::schema::hash32_t finalize() const {
    // BLAKE3_OUT_LEN
    auto output = tearoff::schema::hash32_t{};
    blake3_hasher_finalize(&state_, output.data(), output.size());
    return output;
  }

 private:
  blake3_hasher state_{};
};

}  // namespace

tearoff::schema::hash32_t hash(const std::string_view& str) {
  return hash(tearoff::schema::make_bytes_view(str));
}

tearoff::schema::hash32_t hash(const tearoff::schema::bytes_view_t& bytes) {
  auto state = hasher{};
  state.update(bytes);
  return state.finalize();
}

tearoff::schema::hash32_t hash(
    std::initializer_list<tearoff::schema::bytes_view_t> parts) {
  auto state = hasher{};
  for (const auto& part : parts) {
    state.update(part);
  }
  return state.finalize();
}

}  // namespace tearoff::blake3
