#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace flagstore {

// Custom transparent hasher for string types
struct TransparentStringHash {
  using is_transparent = void; // Enables heterogeneous lookup

  template <typename StringType>
  std::size_t operator()(const StringType &str) const {
    return std::hash<std::string_view>{}(str);
  }
};

// String handling type aliases for performance and consistency
template <typename Value>
using StringKeyedMap =
    std::unordered_map<std::string, Value, TransparentStringHash,
                       std::equal_to<>>;

using StringMap = StringKeyedMap<std::string>;
using StringSet =
    std::unordered_set<std::string, TransparentStringHash, std::equal_to<>>;

// Key/value pairs attached to log entries and exceptions
using LogContext = StringMap;

} // namespace flagstore
