#pragma once

#include "type_definitions.hpp"
#include <array>
#include <cstddef>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace flagstore {

// The two record kinds the store holds. Declaration order is the order in
// which kinds are written to a persistent store: segments before flags.
enum class DataKind { SEGMENTS = 0, FLAGS = 1 };

constexpr std::array<DataKind, 2> ALL_DATA_KINDS = {DataKind::SEGMENTS,
                                                    DataKind::FLAGS};

// "flag" / "segment", as used in change payloads
const char *objectKindName(DataKind kind);

// "features" / "segments", as used for persistent store namespaces
const char *namespaceName(DataKind kind);

std::optional<DataKind> dataKindFromObjectKind(std::string_view name);
std::optional<DataKind> dataKindFromNamespace(std::string_view name);

struct KindAndKey {
  DataKind kind;
  std::string key;

  bool operator==(const KindAndKey &other) const {
    return kind == other.kind && key == other.key;
  }
  bool operator!=(const KindAndKey &other) const { return !(*this == other); }
  bool operator<(const KindAndKey &other) const {
    return kind != other.kind ? kind < other.kind : key < other.key;
  }
};

struct KindAndKeyHash {
  std::size_t operator()(const KindAndKey &value) const;
};

using KindAndKeySet = std::unordered_set<KindAndKey, KindAndKeyHash>;

// Raw item payloads grouped by kind, keyed by item key
using RawItemMap = StringKeyedMap<nlohmann::json>;
using RawCollections = std::map<DataKind, RawItemMap>;

} // namespace flagstore
