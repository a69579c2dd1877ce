#pragma once

#include <relay/schema/event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: event.
// Relay workflow: observable receipt of a ledger movement or of a consumed
// authorization.
namespace relay::schema {

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<event_attribute_t> attributes;
};

using event_t = event<1>;

/// Value of the first attribute named `key`, or empty when absent.
inline std::string attribute_value(const event_t& value,
                                   const std::string& key) {
  for (const auto& attribute : value.attributes) {
    if (attribute.key == key) {
      return attribute.value;
    }
  }
  return {};
}

}  // namespace relay::schema
