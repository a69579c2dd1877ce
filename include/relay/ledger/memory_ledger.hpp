#pragma once

#include <relay/ledger/token_ledger.hpp>
#include <map>
#include <mutex>
#include <set>
#include <tuple>

namespace relay::ledger {

/// In-process multi-token ledger with ERC-20 debit/credit and allowance
/// semantics. An allowance equal to the maximum uint256 is never decremented.
class memory_ledger final : public token_ledger {
 public:
  memory_ledger() = default;

  void register_token(const relay::schema::address_t& token);
  bool has_token(const relay::schema::address_t& token) const;

  /// Credit `amount` to `holder`; registers the token on first use. Fails
  /// with `balance_overflow`, leaving state untouched, when the token's total
  /// supply would exceed the maximum uint256.
  relay::schema::transfer_result_t mint(const relay::schema::address_t& token,
            const relay::schema::address_t& holder,
            const relay::schema::amount_t& amount);

  relay::schema::amount_t total_supply(
      const relay::schema::address_t& token) const;

  relay::schema::amount_t balance_of(
      const relay::schema::address_t& token,
      const relay::schema::address_t& holder) const override;

  relay::schema::amount_t allowance(
      const relay::schema::address_t& token,
      const relay::schema::address_t& owner,
      const relay::schema::address_t& spender) const override;

  void approve(const relay::schema::address_t& token,
               const relay::schema::address_t& owner,
               const relay::schema::address_t& spender,
               const relay::schema::amount_t& amount) override;

  relay::schema::transfer_result_t transfer_from(
      const relay::schema::address_t& token,
      const relay::schema::address_t& spender,
      const relay::schema::address_t& owner,
      const relay::schema::address_t& recipient,
      const relay::schema::amount_t& amount) override;

 private:
  using holder_key_t =
      std::tuple<relay::schema::address_t, relay::schema::address_t>;
  using allowance_key_t =
      std::tuple<relay::schema::address_t, relay::schema::address_t,
                 relay::schema::address_t>;

  mutable std::mutex mutex_;
  std::set<relay::schema::address_t> tokens_;
  std::map<relay::schema::address_t, relay::schema::amount_t> supply_;
  std::map<holder_key_t, relay::schema::amount_t> balances_;
  std::map<allowance_key_t, relay::schema::amount_t> allowances_;
};

/// `transfer` event in the shape the ledger emits it.
relay::schema::event_t make_transfer_event(
    const relay::schema::address_t& token,
    const relay::schema::address_t& from,
    const relay::schema::address_t& to,
    const relay::schema::amount_t& amount);

}  // namespace relay::ledger
