#include <relay/schema/key/engine_keys.hpp>

#include <algorithm>
#include <iterator>

namespace relay::schema::key {

relay::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const relay::schema::bytes_view_t& id) {
  auto key = relay::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

relay::schema::bytes_t make_executed_key(
    const relay::schema::hash32_t& digest) {
  return make_prefixed_key(kExecutedKeyPrefix,
                           relay::schema::bytes_view_t{digest});
}

std::optional<relay::schema::hash32_t> parse_executed_key(
    const relay::schema::bytes_view_t& key) {
  auto prefix = relay::schema::make_bytes_view(kExecutedKeyPrefix);
  if (key.size() != prefix.size() + 32 ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  auto digest = relay::schema::hash32_t{};
  std::copy(std::begin(key) + static_cast<std::ptrdiff_t>(prefix.size()),
            std::end(key), std::begin(digest));
  return digest;
}

}  // namespace relay::schema::key
