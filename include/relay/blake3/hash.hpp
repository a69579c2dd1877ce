#pragma once
#include <relay/schema/primitives.hpp>

namespace relay::blake3 {

relay::schema::hash32_t hash(const relay::schema::bytes_view_t& bytes);

}  // namespace relay::blake3
