#pragma once

#include <relay/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace relay::schema {

enum class transfer_error_code : uint32_t {
  authorization_failed = 1,
  already_executed = 2,
  insufficient_balance = 3,
  insufficient_allowance = 4,
  unknown_token = 5,
  balance_overflow = 6,
};

inline constexpr auto kTransferErrorCodeNames =
    std::array<std::pair<std::string_view, transfer_error_code>, 6>{{
        {"authorization_failed", transfer_error_code::authorization_failed},
        {"already_executed", transfer_error_code::already_executed},
        {"insufficient_balance", transfer_error_code::insufficient_balance},
        {"insufficient_allowance",
         transfer_error_code::insufficient_allowance},
        {"unknown_token", transfer_error_code::unknown_token},
        {"balance_overflow", transfer_error_code::balance_overflow},
    }};

inline constexpr std::string_view kAuthorizationCodespace{
    "relay.authorization"};
inline constexpr std::string_view kReplayCodespace{"relay.replay"};
inline constexpr std::string_view kLedgerCodespace{"relay.ledger"};

constexpr bool is_ledger_error(const transfer_error_code code) {
  return code == transfer_error_code::insufficient_balance ||
         code == transfer_error_code::insufficient_allowance ||
         code == transfer_error_code::unknown_token ||
         code == transfer_error_code::balance_overflow;
}

constexpr std::string_view codespace_of(const transfer_error_code code) {
  if (code == transfer_error_code::authorization_failed) {
    return kAuthorizationCodespace;
  }
  if (code == transfer_error_code::already_executed) {
    return kReplayCodespace;
  }
  return kLedgerCodespace;
}

template <>
inline std::optional<transfer_error_code>
try_from_string<transfer_error_code>(const std::string_view value) {
  return from_string(value, kTransferErrorCodeNames);
}

inline std::string_view to_string(const transfer_error_code code) {
  return to_string(code, kTransferErrorCodeNames).value_or("unknown");
}

}  // namespace relay::schema
