#include <blake3.h>
#include <vellum/blake3/hash.hpp>

namespace vellum::blake3 {

namespace {

vellum::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  static_assert(BLAKE3_OUT_LEN == 32);
  auto output = vellum::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

vellum::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

vellum::schema::hash32_t hash(const vellum::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace vellum::blake3
