#include <vellum/chain/hash_chainer.hpp>
#include <vellum/common/critical.hpp>

#include <openssl/evp.h>

#include <array>
#include <memory>

namespace vellum::chain {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

std::string hash_chainer::hash(const vellum::schema::bytes_view_t& bytes) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    vellum::common::critical("failed to allocate SHA-256 context");
  }
  auto digest = std::array<uint8_t, EVP_MAX_MD_SIZE>{};
  auto length = 0u;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
    vellum::common::critical("SHA-256 digest failed");
  }
  return vellum::schema::to_hex(vellum::schema::bytes_view_t{digest.data(),
                                                             length});
}

std::string hash_chainer::compute(const chain_fields& fields) {
  auto bytes = canonical_encoder::encode(fields);
  return hash(vellum::schema::make_bytes_view(bytes));
}

}  // namespace vellum::chain
