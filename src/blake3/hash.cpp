#include <blake3.h>
#include <warden/blake3/hash.hpp>

namespace warden::blake3 {

namespace {

warden::schema::hash32_t digest(const void* data, const std::size_t size) {
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<warden::schema::hash32_t>);
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = warden::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

warden::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

warden::schema::hash32_t hash(const warden::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace warden::blake3
