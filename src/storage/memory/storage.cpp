#include <spdlog/spdlog.h>
#include <relay/storage/memory/storage.hpp>

namespace relay::storage {

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  if (!path.empty()) {
    spdlog::debug("In-memory storage ignores path '{}'", path);
  }
  return storage<memory_storage_tag>{};
}

}  // namespace relay::storage
