#pragma once
#include <relay/schema/primitives.hpp>
#include <relay/schema/transfer_intent.hpp>

// Schema type: execution record.
// Relay workflow: value stored under a consumed digest. Presence of the record
// is what makes an authorization executed; the status only tells a completed
// transfer apart from one burned by a failing ledger call.
namespace relay::schema {

enum class execution_status : uint8_t {
  pending = 0,
  transferred = 1,
  ledger_failed = 2,
};

template <uint16_t Version>
struct execution_record;

template <>
struct execution_record<1> final {
  uint16_t version{1};
  address_t sender{};
  uint256_bytes_t amount{};
  address_t recipient{};
  address_t token{};
  uint256_bytes_t nonce{};
  execution_status status{execution_status::pending};
  uint32_t ledger_code{};
};

using execution_record_t = execution_record<1>;

inline execution_record_t make_execution_record(
    const transfer_intent_t& intent) {
  return execution_record_t{.version = 1,
                            .sender = intent.sender,
                            .amount = to_uint256_bytes(intent.amount),
                            .recipient = intent.recipient,
                            .token = intent.token,
                            .nonce = to_uint256_bytes(intent.nonce),
                            .status = execution_status::pending,
                            .ledger_code = 0};
}

}  // namespace relay::schema
