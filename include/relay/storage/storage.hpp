#pragma once
#include <relay/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace relay::storage {

using key_value_entry_t =
    std::pair<relay::schema::bytes_t, relay::schema::bytes_t>;

/// Key-value backend selected at build time by a library tag.
template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const relay::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const relay::schema::bytes_view_t& key,
           const T& value);

  /// Whether a value exists at key.
  bool contains(const relay::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const relay::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace relay::storage
