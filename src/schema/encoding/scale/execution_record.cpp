#include <relay/schema/encoding/scale/execution_record.hpp>

namespace relay::schema {

void encode(const execution_record<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.sender, encoder);
  ::scale::encode(o.amount, encoder);
  ::scale::encode(o.recipient, encoder);
  ::scale::encode(o.token, encoder);
  ::scale::encode(o.nonce, encoder);
  ::scale::encode(static_cast<uint8_t>(o.status), encoder);
  ::scale::encode(o.ledger_code, encoder);
}

void decode(execution_record<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.sender, decoder);
  ::scale::decode(o.amount, decoder);
  ::scale::decode(o.recipient, decoder);
  ::scale::decode(o.token, decoder);
  ::scale::decode(o.nonce, decoder);
  auto status = uint8_t{};
  ::scale::decode(status, decoder);
  if (status > static_cast<uint8_t>(execution_status::ledger_failed)) {
    ::scale::raise(::scale::DecodeError::UNEXPECTED_VALUE);
  }
  o.status = static_cast<execution_status>(status);
  ::scale::decode(o.ledger_code, decoder);
}

}  // namespace relay::schema
