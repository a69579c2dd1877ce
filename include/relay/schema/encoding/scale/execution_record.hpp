#pragma once
#include <relay/schema/execution_record.hpp>
#include <scale/scale.hpp>

// Declared beside the schema type so the SCALE codec finds them by
// argument-dependent lookup.
namespace relay::schema {

void encode(const execution_record<1>& o, ::scale::Encoder& encoder);
void decode(execution_record<1>& o, ::scale::Decoder& decoder);

}  // namespace relay::schema
