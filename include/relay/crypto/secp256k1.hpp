#pragma once

#include <relay/schema/primitives.hpp>
#include <optional>

namespace relay::crypto {

/// Whether a libsecp256k1 context could be created.
bool available();

std::optional<relay::schema::private_key_t> generate_private_key();

std::optional<relay::schema::public_key_t> derive_public_key(
    const relay::schema::private_key_t& private_key);

/// Last 20 bytes of Keccak-256 over the uncompressed public key, as an
/// Ethereum address.
relay::schema::address_t derive_address(
    const relay::schema::public_key_t& public_key);

std::optional<relay::schema::address_t> address_of(
    const relay::schema::private_key_t& private_key);

/// ECDSA over the raw 32-byte hash. The result is low-s normalized and
/// carries the recovery id as 27 or 28 in the last byte.
std::optional<relay::schema::signature_t> sign_digest(
    const relay::schema::private_key_t& private_key,
    const relay::schema::hash32_t& hash);

/// Sign `digest` the way a wallet signs a personal message (EIP-191).
std::optional<relay::schema::signature_t> sign_message(
    const relay::schema::private_key_t& private_key,
    const relay::schema::hash32_t& digest);

/// Recover the address whose key produced `signature` over `hash`.
///
/// Returns std::nullopt for malformed signatures: r or s out of range,
/// high-s values, recovery ids other than 0/1/27/28, or an r that is not the
/// x coordinate of a curve point.
std::optional<relay::schema::address_t> recover_address(
    const relay::schema::hash32_t& hash,
    const relay::schema::signature_t& signature);

}  // namespace relay::crypto
