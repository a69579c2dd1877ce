#pragma once

#include <relay/schema/primitives.hpp>
#include <string_view>

// Schema key type: engine keys.
// Relay workflow: canonical key prefixes for state owned by the executor.
namespace relay::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kExecutedKeyPrefix{"SYS|STATE|EXECUTED|"};

relay::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const relay::schema::bytes_view_t& id);

/// Key of the executed-set entry for `digest`.
relay::schema::bytes_t make_executed_key(const relay::schema::hash32_t& digest);

/// Recover the digest from an executed-set key, if `key` is one.
std::optional<relay::schema::hash32_t> parse_executed_key(
    const relay::schema::bytes_view_t& key);

}  // namespace relay::schema::key
