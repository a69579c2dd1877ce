#pragma once

#include <relay/execution/signature_recoverer.hpp>
#include <relay/ledger/token_ledger.hpp>
#include <relay/schema/encoding/scale/encoder.hpp>
#include <relay/schema/execution_record.hpp>
#include <relay/schema/primitives.hpp>
#include <relay/schema/transfer_intent.hpp>
#include <relay/schema/transfer_result.hpp>
#include <relay/storage/memory/storage.hpp>
#include <relay/storage/rocksdb/storage.hpp>
#include <mutex>
#include <optional>
#include <vector>

namespace relay::execution {

/// Verifies signed transfer intents and executes each one at most once.
///
/// The executed set lives in the injected storage backend; the executor holds
/// references to its collaborators and owns nothing but the lock and the
/// signature recoverer. A digest is written to storage before the ledger is
/// called and is never removed, so an authorization whose ledger call fails
/// stays consumed.
template <typename Library>
class executor final {
 public:
  using storage_t = relay::storage::storage<Library>;
  using encoder_t = relay::schema::encoding::scale_encoder_t;

  /// `address` is the identity users approve as spender on the ledger.
  executor(encoder_t& encoder,
           storage_t& storage,
           relay::ledger::token_ledger& ledger,
           const relay::schema::address_t& address);

  executor(const executor&) = delete;
  executor& operator=(const executor&) = delete;

  /// Digest a signer must sign (as a personal message) to authorize the
  /// transfer. Read-only.
  relay::schema::hash32_t compute_digest(
      const relay::schema::address_t& sender,
      const relay::schema::amount_t& amount,
      const relay::schema::address_t& recipient,
      const relay::schema::address_t& token,
      const relay::schema::nonce_t& nonce) const;

  /// Relay a signed intent. Callable by anyone; the caller's identity plays no
  /// part in authorization.
  ///
  /// Gates, in order: signer recovery must yield `sender`, the digest must not
  /// be executed, then the digest is marked executed and the ledger moves
  /// `amount` from `sender` to `recipient`. Ledger failures are reported with
  /// the ledger codespace and leave the digest executed.
  relay::schema::transfer_result_t transfer(
      const relay::schema::address_t& sender,
      const relay::schema::amount_t& amount,
      const relay::schema::address_t& recipient,
      const relay::schema::address_t& token,
      const relay::schema::nonce_t& nonce,
      const relay::schema::signature_t& signature);

  relay::schema::transfer_result_t transfer(
      const relay::schema::transfer_intent_t& intent,
      const relay::schema::signature_t& signature);

  /// Whether `digest` has been consumed.
  bool executed(const relay::schema::hash32_t& digest) const;

  std::optional<relay::schema::execution_record_t> execution_record(
      const relay::schema::hash32_t& digest) const;

  /// Every consumed digest, in key order.
  std::vector<relay::schema::hash32_t> executed_digests() const;

  /// Replace the signer recovery capability (defaults to secp256k1).
  void set_signature_recoverer(signature_recoverer_t recoverer);

  const relay::schema::address_t& address() const;

 private:
  // Recursive so that a ledger calling back into transfer() on the same
  // thread reaches the replay check instead of deadlocking.
  mutable std::recursive_mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  relay::ledger::token_ledger& ledger_;
  relay::schema::address_t address_;
  signature_recoverer_t signature_recoverer_;
};

extern template class executor<relay::storage::rocksdb_storage_tag>;
extern template class executor<relay::storage::memory_storage_tag>;

}  // namespace relay::execution
