#pragma once
#include <relay/storage/storage.hpp>
#include <algorithm>
#include <iterator>
#include <map>

namespace relay::storage {

/// Process-local backend. Nothing survives the object; tests get a fresh
/// keyspace by constructing a new one.
struct memory_storage_tag {};

template <>
struct storage<memory_storage_tag> final {
  std::map<relay::schema::bytes_t, relay::schema::bytes_t> entries;

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
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<memory_storage_tag>::get(
    Encoder& encoder,
    const relay::schema::bytes_view_t& key) const {
  auto found = entries.find(relay::schema::make_bytes(key));
  if (found == std::end(entries)) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      relay::schema::bytes_view_t{found->second})};
}

template <typename T, typename Encoder>
void storage<memory_storage_tag>::put(Encoder& encoder,
                                      const relay::schema::bytes_view_t& key,
                                      const T& value) {
  entries.insert_or_assign(relay::schema::make_bytes(key),
                           encoder.encode(value));
}

inline bool storage<memory_storage_tag>::contains(
    const relay::schema::bytes_view_t& key) const {
  return entries.contains(relay::schema::make_bytes(key));
}

inline std::vector<key_value_entry_t>
storage<memory_storage_tag>::list_by_prefix(
    const relay::schema::bytes_view_t& prefix) const {
  auto out = std::vector<key_value_entry_t>{};
  auto lower = relay::schema::make_bytes(prefix);
  for (auto it = entries.lower_bound(lower); it != std::end(entries); ++it) {
    const auto& key = it->first;
    if (key.size() < prefix.size() ||
        !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
      break;
    }
    out.push_back(*it);
  }
  return out;
}

}  // namespace relay::storage
