#include <relay/blake3/hash.hpp>
#include <relay/digest/builder.hpp>
#include <relay/keccak/hash.hpp>

#include <iterator>
#include <string>

namespace relay::digest {

namespace {

template <std::size_t N>
void append(relay::schema::bytes_t& out, const std::array<uint8_t, N>& value) {
  out.insert(std::end(out), std::begin(value), std::end(value));
}

}  // namespace

relay::schema::transfer_intent_t make_intent(
    const relay::schema::address_t& sender,
    const relay::schema::amount_t& amount,
    const relay::schema::address_t& recipient,
    const relay::schema::address_t& token,
    const relay::schema::nonce_t& nonce) {
  return relay::schema::transfer_intent_t{.version = 1,
                                          .sender = sender,
                                          .amount = amount,
                                          .recipient = recipient,
                                          .token = token,
                                          .nonce = nonce};
}

relay::schema::bytes_t encode_intent(
    const relay::schema::transfer_intent_t& intent) {
  auto out = relay::schema::make_bytes(kIntentDomain);
  out.reserve(kEncodedIntentSize);
  append(out, intent.sender);
  append(out, relay::schema::to_uint256_bytes(intent.amount));
  append(out, intent.recipient);
  append(out, intent.token);
  append(out, relay::schema::to_uint256_bytes(intent.nonce));
  return out;
}

relay::schema::hash32_t compute_digest(
    const relay::schema::transfer_intent_t& intent) {
  auto encoded = encode_intent(intent);
  return relay::blake3::hash(relay::schema::bytes_view_t{encoded});
}

relay::schema::hash32_t compute_digest(
    const relay::schema::address_t& sender,
    const relay::schema::amount_t& amount,
    const relay::schema::address_t& recipient,
    const relay::schema::address_t& token,
    const relay::schema::nonce_t& nonce) {
  return compute_digest(make_intent(sender, amount, recipient, token, nonce));
}

relay::schema::hash32_t personal_message_digest(
    const relay::schema::hash32_t& digest) {
  auto length = std::to_string(digest.size());
  return relay::keccak::hash(
      {relay::schema::make_bytes_view(kPersonalMessagePrefix),
       relay::schema::make_bytes_view(length),
       relay::schema::bytes_view_t{digest}});
}

}  // namespace relay::digest
