#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <relay/common/critical.hpp>
#include <relay/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace relay::storage {

namespace detail {

inline relay::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const relay::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const relay::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const relay::schema::bytes_view_t& key,
           const T& value);

  bool contains(const relay::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const relay::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const relay::schema::bytes_view_t& key) const {
  if (!database) {
    relay::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    relay::common::critical("Failed to get value from RocksDB");
  }
  return {encoder.template decode<T>(relay::schema::make_bytes_view(value))};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const relay::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    relay::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  // Executed-set entries must survive a crash right after the write returns.
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Put(write_options, detail::to_slice(key),
                              detail::to_slice(encoded_value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    relay::common::critical("Failed to put value into RocksDB");
  }
}

inline bool storage<rocksdb_storage_tag>::contains(
    const relay::schema::bytes_view_t& key) const {
  if (!database) {
    relay::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    spdlog::error("Failed to look up RocksDB key: {}", status.ToString());
    relay::common::critical("Failed to look up RocksDB key");
  }
  return true;
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const relay::schema::bytes_view_t& prefix) const {
  if (!database) {
    relay::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string = relay::schema::make_string(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    relay::common::critical("RocksDB iteration failed");
  }
  return entries;
}

}  // namespace relay::storage
