#include <relay/ledger/memory_ledger.hpp>
#include <spdlog/spdlog.h>

#include <iterator>
#include <string>

using namespace relay::schema;

namespace relay::ledger {

namespace {

amount_t lookup(const auto& table, const auto& key) {
  auto found = table.find(key);
  if (found == std::end(table)) {
    return amount_t{};
  }
  return found->second;
}

}  // namespace

event_t make_transfer_event(const address_t& token,
                            const address_t& from,
                            const address_t& to,
                            const amount_t& amount) {
  auto event = event_t{};
  event.type = "transfer";
  event.attributes.push_back(
      {.key = "token", .value = to_hex(token), .index = true});
  event.attributes.push_back(
      {.key = "from", .value = to_hex(from), .index = true});
  event.attributes.push_back({.key = "to", .value = to_hex(to), .index = true});
  event.attributes.push_back({.key = "amount", .value = amount.str()});
  return event;
}

void memory_ledger::register_token(const address_t& token) {
  auto lock = std::scoped_lock{mutex_};
  tokens_.insert(token);
}

bool memory_ledger::has_token(const address_t& token) const {
  auto lock = std::scoped_lock{mutex_};
  return tokens_.contains(token);
}

transfer_result_t memory_ledger::mint(const address_t& token,
                                      const address_t& holder,
                                      const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  // Every balance is bounded by the supply, so this also covers the holder.
  auto supply = lookup(supply_, token);
  if (supply > max_amount() - amount) {
    spdlog::warn("Refusing to mint {} of token {}: supply would overflow",
                 amount.str(), to_hex(token));
    return make_error(transfer_error_code::balance_overflow,
                      "supply overflow",
                      "supply " + supply.str() + ", minting " + amount.str());
  }
  tokens_.insert(token);
  balances_[holder_key_t{token, holder}] += amount;
  supply_[token] = supply + amount;
  spdlog::debug("Minted {} of token {} to {}", amount.str(), to_hex(token),
                to_hex(holder));
  return transfer_result_t{};
}

amount_t memory_ledger::total_supply(const address_t& token) const {
  auto lock = std::scoped_lock{mutex_};
  return lookup(supply_, token);
}

amount_t memory_ledger::balance_of(const address_t& token,
                                   const address_t& holder) const {
  auto lock = std::scoped_lock{mutex_};
  return lookup(balances_, holder_key_t{token, holder});
}

amount_t memory_ledger::allowance(const address_t& token,
                                  const address_t& owner,
                                  const address_t& spender) const {
  auto lock = std::scoped_lock{mutex_};
  return lookup(allowances_, allowance_key_t{token, owner, spender});
}

void memory_ledger::approve(const address_t& token,
                            const address_t& owner,
                            const address_t& spender,
                            const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  allowances_[allowance_key_t{token, owner, spender}] = amount;
}

transfer_result_t memory_ledger::transfer_from(const address_t& token,
                                               const address_t& spender,
                                               const address_t& owner,
                                               const address_t& recipient,
                                               const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  if (!tokens_.contains(token)) {
    return make_error(transfer_error_code::unknown_token, "unknown token",
                      to_hex(token));
  }

  auto allowance_key = allowance_key_t{token, owner, spender};
  auto approved = lookup(allowances_, allowance_key);
  if (approved < amount) {
    return make_error(transfer_error_code::insufficient_allowance,
                      "insufficient allowance",
                      "approved " + approved.str() + ", requested " +
                          amount.str());
  }

  auto owner_key = holder_key_t{token, owner};
  auto balance = lookup(balances_, owner_key);
  if (balance < amount) {
    return make_error(transfer_error_code::insufficient_balance,
                      "insufficient balance",
                      "balance " + balance.str() + ", requested " +
                          amount.str());
  }

  auto recipient_key = holder_key_t{token, recipient};
  auto credited = lookup(balances_, recipient_key);
  if (recipient != owner && credited > max_amount() - amount) {
    return make_error(transfer_error_code::balance_overflow,
                      "recipient balance overflow",
                      "balance " + credited.str() + ", receiving " +
                          amount.str());
  }

  if (approved != max_amount()) {
    allowances_[allowance_key] = approved - amount;
  }
  balances_[owner_key] = balance - amount;
  balances_[recipient_key] += amount;

  auto result = transfer_result_t{};
  result.events.push_back(make_transfer_event(token, owner, recipient, amount));
  return result;
}

}  // namespace relay::ledger
