#pragma once

#include "data_kind.hpp"
#include "store_item.hpp"
#include <optional>
#include <string>

namespace flagstore {

/**
 * Read interface the evaluation engine uses. Deleted items are never
 * returned by either lookup.
 */
class ReadOnlyStore {
public:
  virtual ~ReadOnlyStore() = default;

  virtual std::optional<StoreItem> get(DataKind kind,
                                       const std::string &key) const = 0;
  virtual ItemMap all(DataKind kind) const = 0;
  virtual bool initialized() const = 0;
};

} // namespace flagstore
