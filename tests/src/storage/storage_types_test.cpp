#include <relay/schema/encoding/scale/encoder.hpp>
#include <relay/schema/key/engine_keys.hpp>
#include <relay/storage/memory/storage.hpp>
#include <relay/storage/rocksdb/storage.hpp>
#include <relay/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace {

using encoder_t = relay::schema::encoding::scale_encoder_t;

relay::schema::execution_record_t make_record(const uint8_t seed) {
  auto record = relay::schema::execution_record_t{};
  record.sender = relay::testing::make_address(seed);
  record.amount = relay::schema::to_uint256_bytes(
      relay::schema::amount_t{static_cast<uint64_t>(seed) * 10});
  record.recipient = relay::testing::make_address(seed + 1);
  record.token = relay::testing::make_address(seed + 2);
  record.nonce = relay::schema::to_uint256_bytes(relay::schema::nonce_t{seed});
  record.status = relay::schema::execution_status::transferred;
  return record;
}

template <typename Storage>
void expect_record_round_trip(Storage& storage) {
  auto encoder = encoder_t{};
  auto key = relay::schema::key::make_executed_key(relay::testing::make_hash(1));
  auto key_view = relay::schema::bytes_view_t{key};
  EXPECT_FALSE(storage.contains(key_view));
  EXPECT_FALSE(storage.template get<relay::schema::execution_record_t>(
                          encoder, key_view)
                   .has_value());

  auto record = make_record(0x10);
  storage.put(encoder, key_view, record);
  EXPECT_TRUE(storage.contains(key_view));

  auto loaded =
      storage.template get<relay::schema::execution_record_t>(encoder, key_view);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->sender, record.sender);
  EXPECT_EQ(loaded->amount, record.amount);
  EXPECT_EQ(loaded->recipient, record.recipient);
  EXPECT_EQ(loaded->token, record.token);
  EXPECT_EQ(loaded->nonce, record.nonce);
  EXPECT_EQ(loaded->status, record.status);

  record.status = relay::schema::execution_status::ledger_failed;
  record.ledger_code = 3;
  storage.put(encoder, key_view, record);
  loaded =
      storage.template get<relay::schema::execution_record_t>(encoder, key_view);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->status, relay::schema::execution_status::ledger_failed);
  EXPECT_EQ(loaded->ledger_code, 3u);
}

template <typename Storage>
void expect_prefix_listing(Storage& storage) {
  auto encoder = encoder_t{};
  for (uint8_t seed = 1; seed <= 3; ++seed) {
    auto key =
        relay::schema::key::make_executed_key(relay::testing::make_hash(seed));
    storage.put(encoder, relay::schema::bytes_view_t{key}, make_record(seed));
  }
  auto outside = relay::schema::key::make_prefixed_key(
      "SYS|STATE|OTHER|",
      relay::schema::bytes_view_t{relay::testing::make_hash(9)});
  storage.put(encoder, relay::schema::bytes_view_t{outside}, make_record(9));

  auto rows = storage.list_by_prefix(
      relay::schema::make_bytes_view(relay::schema::key::kExecutedKeyPrefix));
  ASSERT_EQ(rows.size(), 3u);
  for (uint8_t seed = 1; seed <= 3; ++seed) {
    auto digest = relay::schema::key::parse_executed_key(
        relay::schema::bytes_view_t{rows[seed - 1].first});
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(*digest, relay::testing::make_hash(seed));
  }

  auto all = storage.list_by_prefix(
      relay::schema::make_bytes_view(relay::schema::key::kStatePrefix));
  EXPECT_EQ(all.size(), 4u);
}

}  // namespace

TEST(storage_types, executed_key_layout) {
  auto digest = relay::testing::make_hash(0x20);
  auto key = relay::schema::key::make_executed_key(digest);
  ASSERT_EQ(key.size(),
            relay::schema::key::kExecutedKeyPrefix.size() + digest.size());
  EXPECT_EQ(relay::schema::make_string(relay::schema::bytes_view_t{key})
                .substr(0, relay::schema::key::kExecutedKeyPrefix.size()),
            relay::schema::key::kExecutedKeyPrefix);

  auto parsed =
      relay::schema::key::parse_executed_key(relay::schema::bytes_view_t{key});
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, digest);

  key.pop_back();
  EXPECT_FALSE(relay::schema::key::parse_executed_key(
                   relay::schema::bytes_view_t{key})
                   .has_value());
}

TEST(storage_types, memory_record_round_trips) {
  auto storage =
      relay::storage::make_storage<relay::storage::memory_storage_tag>("");
  expect_record_round_trip(storage);
}

TEST(storage_types, record_with_unknown_status_is_rejected) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(make_record(0x20));
  // status byte, followed by the 4-byte ledger code
  ASSERT_EQ(encoded[encoded.size() - 5],
            static_cast<uint8_t>(relay::schema::execution_status::transferred));
  ASSERT_TRUE(encoder
                  .try_decode<relay::schema::execution_record_t>(
                      relay::schema::bytes_view_t{encoded})
                  .has_value());

  encoded[encoded.size() - 5] = 9;
  EXPECT_FALSE(encoder
                   .try_decode<relay::schema::execution_record_t>(
                       relay::schema::bytes_view_t{encoded})
                   .has_value());
}

TEST(storage_types, memory_lists_by_prefix) {
  auto storage =
      relay::storage::make_storage<relay::storage::memory_storage_tag>("");
  expect_prefix_listing(storage);
}

TEST(storage_types, rocksdb_record_round_trips) {
  auto db = relay::testing::make_db_path("relay_storage_record");
  {
    auto storage =
        relay::storage::make_storage<relay::storage::rocksdb_storage_tag>(db);
    expect_record_round_trip(storage);
  }
  relay::testing::remove_path(db);
}

TEST(storage_types, rocksdb_lists_by_prefix) {
  auto db = relay::testing::make_db_path("relay_storage_prefix");
  {
    auto storage =
        relay::storage::make_storage<relay::storage::rocksdb_storage_tag>(db);
    expect_prefix_listing(storage);
  }
  relay::testing::remove_path(db);
}

TEST(storage_types, rocksdb_values_survive_reopen) {
  auto db = relay::testing::make_db_path("relay_storage_reopen");
  auto encoder = encoder_t{};
  auto key = relay::schema::key::make_executed_key(relay::testing::make_hash(5));
  {
    auto storage =
        relay::storage::make_storage<relay::storage::rocksdb_storage_tag>(db);
    storage.put(encoder, relay::schema::bytes_view_t{key}, make_record(5));
  }
  {
    auto storage =
        relay::storage::make_storage<relay::storage::rocksdb_storage_tag>(db);
    EXPECT_TRUE(storage.contains(relay::schema::bytes_view_t{key}));
    auto loaded = storage.get<relay::schema::execution_record_t>(
        encoder, relay::schema::bytes_view_t{key});
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->sender, relay::testing::make_address(5));
  }
  relay::testing::remove_path(db);
}
