#pragma once

#include "data_kind.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace flagstore {

using SortedItems = std::vector<std::pair<std::string, nlohmann::json>>;
using SortedCollections = std::vector<std::pair<DataKind, SortedItems>>;

/**
 * Orders a full data set for writing to a persistent store: segments before
 * flags, and every flag after the prerequisites it references. Stores without
 * transactions then never expose a flag whose prerequisites are missing.
 */
class DataSetSorter {
public:
  static SortedCollections sortAllCollections(const RawCollections &allData);
  static SortedItems sortCollection(DataKind kind, const RawItemMap &items);

private:
  static std::vector<std::string> dependencyKeys(DataKind kind,
                                                 const nlohmann::json &item);
  static void
  addWithDependenciesFirst(DataKind kind, const std::string &key,
                           std::map<std::string, const nlohmann::json *> &remaining,
                           SortedItems &itemsOut);
};

} // namespace flagstore
