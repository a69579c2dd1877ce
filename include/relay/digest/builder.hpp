#pragma once
#include <relay/schema/primitives.hpp>
#include <relay/schema/transfer_intent.hpp>
#include <string_view>

namespace relay::digest {

/// Domain separation tag prepended to every encoded intent.
inline constexpr std::string_view kIntentDomain{"RELAY|TRANSFER|V1|"};

/// EIP-191 personal-message prefix; followed by the decimal length of the
/// message and the message itself.
inline constexpr std::string_view kPersonalMessagePrefix{
    "\x19Ethereum Signed Message:\n"};

/// Size of `encode_intent` output: domain tag, three addresses and two
/// 256-bit words.
inline constexpr std::size_t kEncodedIntentSize =
    kIntentDomain.size() + (3 * 20) + (2 * 32);

relay::schema::transfer_intent_t make_intent(
    const relay::schema::address_t& sender,
    const relay::schema::amount_t& amount,
    const relay::schema::address_t& recipient,
    const relay::schema::address_t& token,
    const relay::schema::nonce_t& nonce);

/// Canonical fixed-width encoding of an intent:
/// domain | sender | amount (BE) | recipient | token | nonce (BE).
relay::schema::bytes_t encode_intent(
    const relay::schema::transfer_intent_t& intent);

/// BLAKE3 of `encode_intent`. Signers and the executor compute this
/// independently, so the result must never depend on anything but the tuple.
relay::schema::hash32_t compute_digest(
    const relay::schema::transfer_intent_t& intent);

relay::schema::hash32_t compute_digest(
    const relay::schema::address_t& sender,
    const relay::schema::amount_t& amount,
    const relay::schema::address_t& recipient,
    const relay::schema::address_t& token,
    const relay::schema::nonce_t& nonce);

/// The hash a wallet actually signs when asked to sign `digest` as a
/// personal message: Keccak-256 of prefix, "32" and the digest.
relay::schema::hash32_t personal_message_digest(
    const relay::schema::hash32_t& digest);

}  // namespace relay::digest
