#include <spdlog/spdlog.h>
#include <relay/digest/builder.hpp>
#include <relay/execution/executor.hpp>
#include <relay/schema/key/engine_keys.hpp>

#include <iterator>
#include <string>
#include <utility>

using namespace relay::schema;

namespace {

std::string short_hex(const hash32_t& digest) {
  return to_hex(bytes_view_t{digest.data(), 8});
}

event_t make_meta_transfer_event(const hash32_t& digest,
                                 const transfer_intent_t& intent) {
  auto event = event_t{};
  event.type = "meta_transfer";
  event.attributes.push_back(
      {.key = "digest", .value = to_hex(digest), .index = true});
  event.attributes.push_back(
      {.key = "sender", .value = to_hex(intent.sender), .index = true});
  event.attributes.push_back({.key = "nonce", .value = intent.nonce.str()});
  return event;
}

}  // namespace

namespace relay::execution {

template <typename Library>
executor<Library>::executor(encoder_t& encoder,
                            storage_t& storage,
                            relay::ledger::token_ledger& ledger,
                            const address_t& address)
    : encoder_{encoder},
      storage_{storage},
      ledger_{ledger},
      address_{address},
      signature_recoverer_{make_secp256k1_recoverer()} {
  spdlog::info("Transfer executor ready at {}", to_hex(address_));
}

template <typename Library>
hash32_t executor<Library>::compute_digest(const address_t& sender,
                                           const amount_t& amount,
                                           const address_t& recipient,
                                           const address_t& token,
                                           const nonce_t& nonce) const {
  return relay::digest::compute_digest(sender, amount, recipient, token, nonce);
}

template <typename Library>
transfer_result_t executor<Library>::transfer(const address_t& sender,
                                              const amount_t& amount,
                                              const address_t& recipient,
                                              const address_t& token,
                                              const nonce_t& nonce,
                                              const signature_t& signature) {
  return transfer(
      relay::digest::make_intent(sender, amount, recipient, token, nonce),
      signature);
}

template <typename Library>
transfer_result_t executor<Library>::transfer(const transfer_intent_t& intent,
                                              const signature_t& signature) {
  auto digest = relay::digest::compute_digest(intent);
  auto signed_digest = relay::digest::personal_message_digest(digest);

  auto lock = std::scoped_lock{mutex_};

  auto recovered = std::optional<address_t>{};
  if (signature_recoverer_) {
    recovered = signature_recoverer_(signed_digest, signature);
  }
  if (!recovered) {
    spdlog::warn("Rejected intent {}: signature recovery failed",
                 short_hex(digest));
    auto result = make_error(transfer_error_code::authorization_failed,
                             "invalid signature", "signer recovery failed");
    result.digest = digest;
    return result;
  }
  if (*recovered != intent.sender) {
    spdlog::warn("Rejected intent {}: signed by {}, claimed sender {}",
                 short_hex(digest), to_hex(*recovered), to_hex(intent.sender));
    auto result = make_error(
        transfer_error_code::authorization_failed, "invalid signature",
        "recovered " + to_hex(*recovered) + ", claimed " + to_hex(intent.sender));
    result.digest = digest;
    return result;
  }

  auto key = relay::schema::key::make_executed_key(digest);
  auto key_view = bytes_view_t{key};
  if (storage_.contains(key_view)) {
    spdlog::warn("Rejected intent {}: already executed", short_hex(digest));
    auto result =
        make_error(transfer_error_code::already_executed, "already executed");
    result.digest = digest;
    return result;
  }

  // Consumed before the ledger runs; nothing below may undo this write.
  auto record = make_execution_record(intent);
  storage_.put(encoder_, key_view, record);

  auto ledger_result = ledger_.transfer_from(intent.token, address_,
                                             intent.sender, intent.recipient,
                                             intent.amount);
  record.status = ledger_result.ok() ? execution_status::transferred
                                     : execution_status::ledger_failed;
  record.ledger_code = ledger_result.code;
  storage_.put(encoder_, key_view, record);

  if (!ledger_result.ok()) {
    spdlog::warn("Intent {} consumed but ledger transfer failed: {} ({})",
                 short_hex(digest), ledger_result.log, ledger_result.info);
    ledger_result.digest = digest;
    return ledger_result;
  }

  spdlog::info("Executed intent {}: {} moved {} -> {} on token {}",
               short_hex(digest), intent.amount.str(), to_hex(intent.sender),
               to_hex(intent.recipient), to_hex(intent.token));

  auto result = transfer_result_t{};
  result.digest = digest;
  result.info = "transfer executed";
  result.events = std::move(ledger_result.events);
  result.events.push_back(make_meta_transfer_event(digest, intent));
  return result;
}

template <typename Library>
bool executor<Library>::executed(const hash32_t& digest) const {
  auto lock = std::scoped_lock{mutex_};
  auto key = relay::schema::key::make_executed_key(digest);
  return storage_.contains(bytes_view_t{key});
}

template <typename Library>
std::optional<execution_record_t> executor<Library>::execution_record(
    const hash32_t& digest) const {
  auto lock = std::scoped_lock{mutex_};
  auto key = relay::schema::key::make_executed_key(digest);
  return storage_.template get<execution_record_t>(encoder_, bytes_view_t{key});
}

template <typename Library>
std::vector<hash32_t> executor<Library>::executed_digests() const {
  auto lock = std::scoped_lock{mutex_};
  auto digests = std::vector<hash32_t>{};
  auto rows = storage_.list_by_prefix(
      make_bytes_view(relay::schema::key::kExecutedKeyPrefix));
  digests.reserve(rows.size());
  for (const auto& [key, value] : rows) {
    if (auto digest =
            relay::schema::key::parse_executed_key(bytes_view_t{key})) {
      digests.push_back(*digest);
    }
  }
  return digests;
}

template <typename Library>
void executor<Library>::set_signature_recoverer(
    signature_recoverer_t recoverer) {
  auto lock = std::scoped_lock{mutex_};
  signature_recoverer_ = std::move(recoverer);
}

template <typename Library>
const address_t& executor<Library>::address() const {
  return address_;
}

template class executor<relay::storage::rocksdb_storage_tag>;
template class executor<relay::storage::memory_storage_tag>;

}  // namespace relay::execution
