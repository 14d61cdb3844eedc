#include <blake3.h>
#include <hashlock/blake3/hash.hpp>

namespace hashlock::blake3 {

namespace {

hashlock::schema::hash32_t digest(const void* data, const size_t size) {
  static_assert(BLAKE3_OUT_LEN == sizeof(hashlock::schema::hash32_t));
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = hashlock::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

hashlock::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

hashlock::schema::hash32_t hash(const hashlock::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace hashlock::blake3
