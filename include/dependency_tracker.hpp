#pragma once

#include "data_kind.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

namespace flagstore {

/**
 * Directed graph of "item depends on item" edges between flags and segments.
 *
 * A flag depends on its prerequisite flags and on segments named by
 * segmentMatch clauses in its rules; a segment depends on segments named by
 * its own rules. The tracker is not synchronized; the owner serializes access.
 */
class DependencyTracker {
public:
  // Replaces the outgoing edges of (kind, key) with those found in item
  void updateDependenciesFrom(DataKind kind, const std::string &key,
                              const nlohmann::json &item);

  // Adds item and everything that transitively depends on it
  void addAffectedItems(KindAndKeySet &itemsOut,
                        const KindAndKey &initialModifiedItem) const;

  void reset();

  static KindAndKeySet computeDependenciesFrom(DataKind kind,
                                               const nlohmann::json &item);

private:
  std::unordered_map<KindAndKey, KindAndKeySet, KindAndKeyHash> from_;
  std::unordered_map<KindAndKey, KindAndKeySet, KindAndKeyHash> to_;
};

} // namespace flagstore
