#include <blake3.h>
#include <relay/blake3/hash.hpp>

namespace relay::blake3 {

relay::schema::hash32_t hash(const relay::schema::bytes_view_t& bytes) {
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<relay::schema::hash32_t>);
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = relay::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace relay::blake3
