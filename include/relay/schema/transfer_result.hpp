#pragma once

#include <relay/schema/event.hpp>
#include <relay/schema/primitives.hpp>
#include <relay/schema/transfer_error_code.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace relay::schema {

template <uint16_t Version>
struct transfer_result;

template <>
struct transfer_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  hash32_t digest{};
  std::vector<event_t> events;

  bool ok() const { return code == 0; }
};

using transfer_result_t = transfer_result<1>;

inline transfer_result_t make_error(const transfer_error_code code,
                                    std::string log,
                                    std::string info = {}) {
  auto result = transfer_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace_of(code)};
  return result;
}

inline bool has_error(const transfer_result_t& result,
                      const transfer_error_code code) {
  return result.code == static_cast<uint32_t>(code);
}

}  // namespace relay::schema
