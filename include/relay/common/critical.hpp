#pragma once

#include <csignal>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace relay::common {

/// Log a fatal environment fault, flush every sink and stop the process.
///
/// Reserved for conditions the relay cannot continue from (a storage backend
/// that refuses reads or writes, unusable operator input). Domain failures are
/// reported through result codes instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(fmt::format_string<Args...> format, Args&&... args) {
  critical(std::string_view{fmt::format(format, std::forward<Args>(args)...)});
}

}  // namespace relay::common
