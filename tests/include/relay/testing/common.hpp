#pragma once

#include <relay/digest/builder.hpp>
#include <relay/execution/signature_recoverer.hpp>
#include <relay/schema/primitives.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace relay::testing {

inline relay::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = relay::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline relay::schema::address_t make_address(const uint8_t seed) {
  auto out = relay::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

// Deterministic stand-in for secp256k1: the "signature" is the signer's
// address followed by the hash it signed.
inline relay::schema::signature_t fake_sign(
    const relay::schema::address_t& signer,
    const relay::schema::hash32_t& signed_digest) {
  auto signature = relay::schema::signature_t{};
  std::copy(std::begin(signer), std::end(signer), std::begin(signature));
  std::copy(std::begin(signed_digest), std::end(signed_digest),
            std::begin(signature) + signer.size());
  signature[64] = 27;
  return signature;
}

inline relay::schema::signature_t fake_sign_message(
    const relay::schema::address_t& signer,
    const relay::schema::hash32_t& digest) {
  return fake_sign(signer, relay::digest::personal_message_digest(digest));
}

inline relay::execution::signature_recoverer_t fake_recoverer() {
  return [](const relay::schema::hash32_t& signed_digest,
            const relay::schema::signature_t& signature)
             -> std::optional<relay::schema::address_t> {
    auto signer = relay::schema::address_t{};
    std::copy_n(std::begin(signature), signer.size(), std::begin(signer));
    if (!std::equal(std::begin(signed_digest), std::end(signed_digest),
                    std::begin(signature) + signer.size())) {
      return std::nullopt;
    }
    return signer;
  };
}

}  // namespace relay::testing
