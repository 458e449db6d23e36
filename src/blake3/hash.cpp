#include <blake3.h>
#include <sentinel/blake3/hash.hpp>

#include <tuple>

namespace sentinel::blake3 {

namespace {

sentinel::schema::hash32_t finalize(blake3_hasher& hasher) {
  auto output = sentinel::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<sentinel::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

sentinel::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  return finalize(hasher);
}

sentinel::schema::hash32_t hash(const sentinel::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  return finalize(hasher);
}

std::string hash_hex(const std::string_view& str) {
  const auto digest = hash(str);
  return sentinel::schema::to_hex(
      sentinel::schema::bytes_view_t{digest.data(), digest.size()});
}

}  // namespace sentinel::blake3
