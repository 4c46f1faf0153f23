#include <blake3.h>
#include <keyward/blake3/hash.hpp>

namespace keyward::blake3 {

namespace {

keyward::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = keyward::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<keyward::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

keyward::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

keyward::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace keyward::blake3
