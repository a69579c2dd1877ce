#pragma once

#include <relay/execution/executor.hpp>
#include <relay/ledger/memory_ledger.hpp>
#include <relay/storage/memory/storage.hpp>
#include <relay/testing/common.hpp>

namespace relay::testing {

using memory_executor_t =
    relay::execution::executor<relay::storage::memory_storage_tag>;

/// Executor over in-memory storage and ledger, with the fake signer
/// installed. `user` holds 10000 of `token` and has approved the executor for
/// the maximum allowance.
class executor_fixture final {
 public:
  static constexpr uint64_t kInitialBalance = 10000;

  executor_fixture()
      : storage_{relay::storage::make_storage<
            relay::storage::memory_storage_tag>("")},
        executor_{encoder_, storage_, ledger_, make_address(0xE0)} {
    executor_.set_signature_recoverer(fake_recoverer());
    ledger_.mint(token, user, relay::schema::amount_t{kInitialBalance});
    ledger_.approve(token, user, executor_.address(),
                    relay::schema::max_amount());
  }

  executor_fixture(const executor_fixture&) = delete;
  executor_fixture& operator=(const executor_fixture&) = delete;

  memory_executor_t& executor() { return executor_; }
  relay::ledger::memory_ledger& ledger() { return ledger_; }
  relay::storage::storage<relay::storage::memory_storage_tag>& storage() {
    return storage_;
  }

  relay::schema::transfer_intent_t intent(const uint64_t amount,
                                          const uint64_t nonce) const {
    return relay::digest::make_intent(user, relay::schema::amount_t{amount},
                                      recipient, token,
                                      relay::schema::nonce_t{nonce});
  }

  relay::schema::signature_t sign(
      const relay::schema::transfer_intent_t& value) const {
    return fake_sign_message(value.sender,
                             relay::digest::compute_digest(value));
  }

  relay::schema::amount_t balance(const relay::schema::address_t& holder) {
    return ledger_.balance_of(token, holder);
  }

  const relay::schema::address_t user{make_address(0x10)};
  const relay::schema::address_t recipient{make_address(0x30)};
  const relay::schema::address_t token{make_address(0x50)};

 private:
  relay::schema::encoding::scale_encoder_t encoder_;
  relay::storage::storage<relay::storage::memory_storage_tag> storage_;
  relay::ledger::memory_ledger ledger_;
  memory_executor_t executor_;
};

}  // namespace relay::testing
