#pragma once

#include <relay/schema/primitives.hpp>
#include <functional>
#include <optional>

namespace relay::execution {

/// Capability that maps (signed digest, signature) to the signing address.
/// std::nullopt means the signature could not be interpreted at all.
using signature_recoverer_t = std::function<std::optional<
    relay::schema::address_t>(const relay::schema::hash32_t& signed_digest,
                              const relay::schema::signature_t& signature)>;

/// Recoverer backed by relay::crypto::recover_address.
signature_recoverer_t make_secp256k1_recoverer();

}  // namespace relay::execution
