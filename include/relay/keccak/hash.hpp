#pragma once
#include <relay/schema/primitives.hpp>
#include <initializer_list>

namespace relay::keccak {

/// Keccak-256 with the original 0x01 padding, as Ethereum uses it. Not the
/// FIPS 202 SHA3-256.
relay::schema::hash32_t hash(const relay::schema::bytes_view_t& bytes);

/// Hash the concatenation of `parts` without materializing it.
relay::schema::hash32_t hash(
    std::initializer_list<relay::schema::bytes_view_t> parts);

}  // namespace relay::keccak
