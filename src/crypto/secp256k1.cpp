#include <relay/crypto/secp256k1.hpp>
#include <relay/digest/builder.hpp>
#include <relay/keccak/hash.hpp>

#include <openssl/rand.h>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <memory>

namespace relay::crypto {

namespace {

using context_ptr =
    std::unique_ptr<secp256k1_context, decltype(&secp256k1_context_destroy)>;

constexpr auto kUncompressedPointSize = std::size_t{65};

context_ptr make_context() {
  auto ctx = context_ptr{
      secp256k1_context_create(SECP256K1_CONTEXT_SIGN |
                               SECP256K1_CONTEXT_VERIFY),
      secp256k1_context_destroy};
  if (!ctx) {
    spdlog::error("Failed to create secp256k1 context");
    return ctx;
  }
  // Blinding for side-channel resistance of signing and key generation.
  auto seed = std::array<uint8_t, 32>{};
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1 ||
      secp256k1_context_randomize(ctx.get(), seed.data()) != 1) {
    spdlog::warn("secp256k1 context left unblinded");
  }
  return ctx;
}

// Shared, never mutated after construction.
const secp256k1_context* context() {
  static const auto ctx = make_context();
  return ctx.get();
}

std::optional<relay::schema::public_key_t> serialize(
    const secp256k1_pubkey& pubkey) {
  auto encoded = std::array<uint8_t, kUncompressedPointSize>{};
  auto size = encoded.size();
  if (secp256k1_ec_pubkey_serialize(context(), encoded.data(), &size, &pubkey,
                                    SECP256K1_EC_UNCOMPRESSED) != 1 ||
      size != encoded.size()) {
    return std::nullopt;
  }
  auto public_key = relay::schema::public_key_t{};
  std::copy(std::begin(encoded) + 1, std::end(encoded),
            std::begin(public_key));
  return public_key;
}

}  // namespace

bool available() {
  return context() != nullptr;
}

std::optional<relay::schema::private_key_t> generate_private_key() {
  if (!available()) {
    return std::nullopt;
  }
  auto private_key = relay::schema::private_key_t{};
  // Rejection sampling; a draw outside [1, n) is astronomically rare.
  for (auto attempt = 0; attempt < 16; ++attempt) {
    if (RAND_bytes(private_key.data(), static_cast<int>(private_key.size())) !=
        1) {
      spdlog::error("OpenSSL RAND_bytes failed while generating a key");
      return std::nullopt;
    }
    if (secp256k1_ec_seckey_verify(context(), private_key.data()) == 1) {
      return private_key;
    }
  }
  return std::nullopt;
}

std::optional<relay::schema::public_key_t> derive_public_key(
    const relay::schema::private_key_t& private_key) {
  if (!available()) {
    return std::nullopt;
  }
  auto pubkey = secp256k1_pubkey{};
  if (secp256k1_ec_pubkey_create(context(), &pubkey, private_key.data()) !=
      1) {
    return std::nullopt;
  }
  return serialize(pubkey);
}

relay::schema::address_t derive_address(
    const relay::schema::public_key_t& public_key) {
  auto hash = relay::keccak::hash(relay::schema::bytes_view_t{public_key});
  auto address = relay::schema::address_t{};
  std::copy(std::end(hash) - static_cast<std::ptrdiff_t>(address.size()),
            std::end(hash), std::begin(address));
  return address;
}

std::optional<relay::schema::address_t> address_of(
    const relay::schema::private_key_t& private_key) {
  auto public_key = derive_public_key(private_key);
  if (!public_key) {
    return std::nullopt;
  }
  return derive_address(*public_key);
}

std::optional<relay::schema::signature_t> sign_digest(
    const relay::schema::private_key_t& private_key,
    const relay::schema::hash32_t& hash) {
  if (!available()) {
    return std::nullopt;
  }
  auto sig = secp256k1_ecdsa_recoverable_signature{};
  if (secp256k1_ecdsa_sign_recoverable(context(), &sig, hash.data(),
                                       private_key.data(),
                                       secp256k1_nonce_function_rfc6979,
                                       nullptr) != 1) {
    spdlog::error("secp256k1 signing rejected the private key");
    return std::nullopt;
  }
  // libsecp256k1 only produces low-s signatures.
  auto signature = relay::schema::signature_t{};
  auto recovery_id = -1;
  secp256k1_ecdsa_recoverable_signature_serialize_compact(
      context(), signature.data(), &recovery_id, &sig);
  if (recovery_id < 0 || recovery_id > 1) {
    // Ids 2 and 3 need r >= n, which has negligible probability.
    spdlog::warn("secp256k1 signature has recovery id {}", recovery_id);
    return std::nullopt;
  }
  signature[64] = static_cast<uint8_t>(27 + recovery_id);
  return signature;
}

std::optional<relay::schema::signature_t> sign_message(
    const relay::schema::private_key_t& private_key,
    const relay::schema::hash32_t& digest) {
  return sign_digest(private_key,
                     relay::digest::personal_message_digest(digest));
}

std::optional<relay::schema::address_t> recover_address(
    const relay::schema::hash32_t& hash,
    const relay::schema::signature_t& signature) {
  if (!available()) {
    return std::nullopt;
  }

  auto v = signature[64];
  if (v >= 27) {
    v = static_cast<uint8_t>(v - 27);
  }
  if (v > 1) {
    return std::nullopt;
  }

  // Fails when r or s is not below the group order.
  auto sig = secp256k1_ecdsa_recoverable_signature{};
  if (secp256k1_ecdsa_recoverable_signature_parse_compact(
          context(), &sig, signature.data(), static_cast<int>(v)) != 1) {
    return std::nullopt;
  }

  auto plain = secp256k1_ecdsa_signature{};
  secp256k1_ecdsa_recoverable_signature_convert(context(), &plain, &sig);
  if (secp256k1_ecdsa_signature_normalize(context(), nullptr, &plain) == 1) {
    return std::nullopt;
  }

  // Fails for zero r or s and for an r that is not an x coordinate.
  auto pubkey = secp256k1_pubkey{};
  if (secp256k1_ecdsa_recover(context(), &pubkey, &sig, hash.data()) != 1) {
    return std::nullopt;
  }
  auto public_key = serialize(pubkey);
  if (!public_key) {
    return std::nullopt;
  }
  return derive_address(*public_key);
}

}  // namespace relay::crypto
