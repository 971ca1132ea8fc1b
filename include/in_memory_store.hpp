#pragma once

#include "data_kind.hpp"
#include "lock_utils.hpp"
#include "read_only_store.hpp"
#include "store_item.hpp"
#include <atomic>
#include <chrono>
#include <optional>

namespace flagstore {

/**
 * Snapshot of all current flags and segments.
 *
 * Incoming collections are decoded in full before the write lock is taken,
 * so a payload that fails to decode leaves the store untouched.
 */
class InMemoryStore : public ReadOnlyStore {
public:
  explicit InMemoryStore(
      std::chrono::milliseconds lockTimeout = std::chrono::milliseconds(5000));

  std::optional<StoreItem> get(DataKind kind,
                               const std::string &key) const override;
  ItemMap all(DataKind kind) const override;
  bool initialized() const override { return initialized_.load(); }

  // Replaces the entire contents and marks the store initialized
  bool setBasis(const RawCollections &collections);

  // Overwrites each given item; versions are not compared
  bool applyDelta(const RawCollections &collections);

  // Every item including tombstones, for diffing and persistence
  ItemCollections snapshot() const;

private:
  mutable ResourceSharedMutex mutex_;
  std::chrono::milliseconds lockTimeout_;
  ItemCollections items_;
  std::atomic<bool> initialized_{false};

  static std::optional<ItemCollections>
  decodeCollections(const RawCollections &collections);
};

} // namespace flagstore
