#include <custodia/common/critical.hpp>
#include <custodia/crypto/sha256.hpp>

#include <openssl/evp.h>

#include <memory>

namespace custodia::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

custodia::schema::hash32_t sha256(
    const custodia::schema::bytes_view_t& bytes) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    custodia::common::critical("failed to allocate OpenSSL digest context");
  }

  auto output = custodia::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), output.data(), &length) != 1 ||
      length != output.size()) {
    custodia::common::critical("OpenSSL SHA-256 digest failed");
  }
  return output;
}

}  // namespace custodia::crypto
