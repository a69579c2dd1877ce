#include <relay/common/critical.hpp>
#include <relay/keccak/hash.hpp>

#include <openssl/evp.h>

#include <memory>

namespace relay::keccak {

namespace {

using evp_md_ptr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// Fetched once from the default provider; read-only afterwards.
const EVP_MD* keccak256() {
  static const auto md =
      evp_md_ptr{EVP_MD_fetch(nullptr, "KECCAK-256", nullptr), EVP_MD_free};
  if (!md) {
    relay::common::critical("OpenSSL does not provide KECCAK-256");
  }
  return md.get();
}

relay::schema::hash32_t digest(
    std::initializer_list<relay::schema::bytes_view_t> parts) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || EVP_DigestInit_ex(ctx.get(), keccak256(), nullptr) != 1) {
    relay::common::critical("failed to initialize KECCAK-256");
  }
  for (const auto& part : parts) {
    if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
      relay::common::critical("failed to update KECCAK-256");
    }
  }
  auto output = relay::schema::hash32_t{};
  auto size = 0u;
  if (EVP_DigestFinal_ex(ctx.get(), output.data(), &size) != 1 ||
      size != output.size()) {
    relay::common::critical("failed to finalize KECCAK-256");
  }
  return output;
}

}  // namespace

relay::schema::hash32_t hash(const relay::schema::bytes_view_t& bytes) {
  return digest({bytes});
}

relay::schema::hash32_t hash(
    std::initializer_list<relay::schema::bytes_view_t> parts) {
  return digest(parts);
}

}  // namespace relay::keccak
