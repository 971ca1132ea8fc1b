#pragma once

#include "data_kind.hpp"
#include "data_set_sorter.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace flagstore {

/**
 * Contract for an external store that mirrors the in-memory data, such as a
 * Redis database shared by several processes. Items are exchanged as their
 * raw JSON payloads; tombstones are stored like any other item.
 *
 * Implementations report failures by throwing.
 */
class PersistentDataStore {
public:
  virtual ~PersistentDataStore() = default;

  // Replaces all data; the collections arrive in dependency order
  virtual void init(const SortedCollections &allData) = 0;

  virtual std::optional<nlohmann::json> get(DataKind kind,
                                            const std::string &key) = 0;
  virtual RawItemMap all(DataKind kind) = 0;

  // Writes the item unless the stored version is the same or newer.
  // Returns true if the item was written.
  virtual bool upsert(DataKind kind, const nlohmann::json &item) = 0;

  virtual bool remove(DataKind kind, const std::string &key, int64_t version);

  virtual bool initialized() = 0;

  virtual void stop() {}
};

/**
 * Optional capability of a PersistentDataStore: a cheap probe the recovery
 * poller can call while the store is considered unavailable.
 */
class StoreAvailabilityProbe {
public:
  virtual ~StoreAvailabilityProbe() = default;

  virtual bool monitoringEnabled() const = 0;
  virtual bool isAvailable() = 0;
};

} // namespace flagstore
