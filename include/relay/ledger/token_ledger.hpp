#pragma once

#include <relay/schema/primitives.hpp>
#include <relay/schema/transfer_result.hpp>

namespace relay::ledger {

/// Fungible-token ledger the executor moves funds through.
///
/// Every token is identified by its address; holders approve spenders per
/// token. `transfer_from` moves `amount` from `owner` to `recipient` on behalf
/// of `spender` and fails without side effects when the token is unknown, the
/// spender's allowance is short or the owner's balance is short. On success the
/// result carries a `transfer` event.
class token_ledger {
 public:
  virtual ~token_ledger() = default;

  virtual relay::schema::amount_t balance_of(
      const relay::schema::address_t& token,
      const relay::schema::address_t& holder) const = 0;

  virtual relay::schema::amount_t allowance(
      const relay::schema::address_t& token,
      const relay::schema::address_t& owner,
      const relay::schema::address_t& spender) const = 0;

  virtual void approve(const relay::schema::address_t& token,
                       const relay::schema::address_t& owner,
                       const relay::schema::address_t& spender,
                       const relay::schema::amount_t& amount) = 0;

  virtual relay::schema::transfer_result_t transfer_from(
      const relay::schema::address_t& token,
      const relay::schema::address_t& spender,
      const relay::schema::address_t& owner,
      const relay::schema::address_t& recipient,
      const relay::schema::amount_t& amount) = 0;
};

}  // namespace relay::ledger
