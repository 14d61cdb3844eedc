#include <hashlock/blake3/hash.hpp>
#include <hashlock/common/critical.hpp>
#include <hashlock/crypto/commitment.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <memory>

namespace hashlock::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

hashlock::schema::hash32_t sha256(const hashlock::schema::bytes_view_t& bytes) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    hashlock::common::critical("failed to allocate OpenSSL digest context");
  }

  auto output = hashlock::schema::hash32_t{};
  auto written = 0u;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), output.data(), &written) != 1 ||
      written != output.size()) {
    hashlock::common::critical("OpenSSL SHA-256 digest failed");
  }
  return output;
}

}  // namespace

hashlock::schema::hash32_t commitment(
    const hashlock::schema::hash_algorithm_t algorithm,
    const hashlock::schema::bytes_view_t& secret) {
  switch (algorithm) {
    case hashlock::schema::hash_algorithm_t::sha256:
      return sha256(secret);
    case hashlock::schema::hash_algorithm_t::blake3:
      return hashlock::blake3::hash(secret);
  }
  hashlock::common::critical("unknown commitment hash algorithm");
}

bool matches_commitment(const hashlock::schema::hash_algorithm_t algorithm,
                        const hashlock::schema::bytes_view_t& secret,
                        const hashlock::schema::hash32_t& expected) {
  auto actual = commitment(algorithm, secret);
  return CRYPTO_memcmp(actual.data(), expected.data(), expected.size()) == 0;
}

}  // namespace hashlock::crypto
