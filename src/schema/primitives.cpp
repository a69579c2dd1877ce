#include <relay/common/critical.hpp>
#include <relay/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string_view>

namespace relay::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(
    const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(out));
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  return try_make_fixed<32>(hex);
}

hash32_t make_zero_hash() {
  return {};
}

address_t make_address(const std::string_view& hex) {
  auto address = try_make_address(hex);
  if (!address.has_value()) {
    relay::common::critical("expected 20 bytes of hex, got '{}'", hex);
  }
  return *address;
}

std::optional<address_t> try_make_address(const std::string_view& hex) {
  return try_make_fixed<20>(hex);
}

std::optional<signature_t> try_make_signature(const std::string_view& hex) {
  return try_make_fixed<65>(hex);
}

std::optional<private_key_t> try_make_private_key(const std::string_view& hex) {
  return try_make_fixed<32>(hex);
}

uint256_bytes_t to_uint256_bytes(const boost::multiprecision::uint256_t& value) {
  auto minimal = bytes_t{};
  boost::multiprecision::export_bits(value, std::back_inserter(minimal), 8);
  auto out = uint256_bytes_t{};
  // export_bits writes at least one byte and never more than 32 for uint256.
  std::copy(std::begin(minimal), std::end(minimal),
            std::begin(out) + (out.size() - minimal.size()));
  return out;
}

boost::multiprecision::uint256_t from_uint256_bytes(
    const uint256_bytes_t& bytes) {
  auto value = boost::multiprecision::uint256_t{};
  boost::multiprecision::import_bits(value, std::begin(bytes), std::end(bytes),
                                     8);
  return value;
}

std::optional<boost::multiprecision::uint256_t> try_make_uint256(
    std::string_view text) {
  auto base = 10u;
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
    base = 16u;
  }
  if (text.empty()) {
    return std::nullopt;
  }

  auto accumulated = boost::multiprecision::cpp_int{};
  for (const auto ch : text) {
    auto digit = hex_nibble(ch);
    if (!digit || *digit >= base) {
      return std::nullopt;
    }
    accumulated = (accumulated * base) + *digit;
    if (accumulated > boost::multiprecision::cpp_int{max_amount()}) {
      return std::nullopt;
    }
  }
  return static_cast<boost::multiprecision::uint256_t>(accumulated);
}

amount_t max_amount() {
  return std::numeric_limits<amount_t>::max();
}

}  // namespace relay::schema
