#pragma once
#include <relay/schema/primitives.hpp>

// Schema type: transfer intent.
// Relay workflow: the tuple a user signs off-chain; rebuilt per call from the
// relayer's arguments and never persisted directly.
namespace relay::schema {

template <uint16_t Version>
struct transfer_intent;

template <>
struct transfer_intent<1> final {
  uint16_t version{1};
  address_t sender{};
  amount_t amount{};
  address_t recipient{};
  address_t token{};
  nonce_t nonce{};

  bool operator==(const transfer_intent&) const = default;
};

using transfer_intent_t = transfer_intent<1>;

}  // namespace relay::schema
