#include <blake3.h>
#include <aegis/blake3/hash.hpp>

namespace aegis::blake3 {

aegis::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = aegis::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<aegis::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

aegis::schema::hash32_t hash(const aegis::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = aegis::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace aegis::blake3
