#pragma once
#include <relay/schema/primitives.hpp>
#include <optional>

namespace relay::schema::encoding {

// Encoder selection is a build time setting: callers name a library tag and
// get the matching specialization. Only SCALE is provided.
template <typename Library>
struct encoder {
  template <typename T>
  relay::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, relay::schema::bytes_t& out);

  template <typename T>
  T decode(const relay::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const relay::schema::bytes_view_t& bytes);
};

}  // namespace relay::schema::encoding
