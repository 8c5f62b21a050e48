#include <blake3.h>
#include <anchor/blake3/hash.hpp>

namespace anchor::blake3 {

namespace {

static_assert(std::tuple_size_v<anchor::schema::hash32_t> == BLAKE3_OUT_LEN);

anchor::schema::hash32_t finalize(blake3_hasher& hasher) {
  auto output = anchor::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

anchor::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  return finalize(hasher);
}

anchor::schema::hash32_t hash(const anchor::schema::bytes_view_t& bytes) {
  return hash({bytes});
}

anchor::schema::hash32_t hash(
    std::initializer_list<anchor::schema::bytes_view_t> parts) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  for (const auto& part : parts) {
    blake3_hasher_update(&hasher, part.data(), part.size());
  }
  return finalize(hasher);
}

}  // namespace anchor::blake3
