#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace relay::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using amount_t = boost::multiprecision::uint256_t;
using nonce_t = boost::multiprecision::uint256_t;
using uint256_bytes_t = std::array<uint8_t, 32>;

using private_key_t = std::array<uint8_t, 32>;
// Uncompressed secp256k1 point without the 0x04 tag: x || y.
using public_key_t = std::array<uint8_t, 64>;
// r || s || v
using signature_t = std::array<uint8_t, 65>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

address_t make_address(const std::string_view& hex);
std::optional<address_t> try_make_address(const std::string_view& hex);

std::optional<signature_t> try_make_signature(const std::string_view& hex);
std::optional<private_key_t> try_make_private_key(const std::string_view& hex);

/// Fixed-width big-endian image of a 256-bit value.
uint256_bytes_t to_uint256_bytes(const boost::multiprecision::uint256_t& value);
boost::multiprecision::uint256_t from_uint256_bytes(
    const uint256_bytes_t& bytes);

/// Parse a decimal or 0x-prefixed hex unsigned 256-bit integer.
std::optional<boost::multiprecision::uint256_t> try_make_uint256(
    std::string_view text);

amount_t max_amount();

}  // namespace relay::schema
