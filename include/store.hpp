#pragma once

#include "broadcaster.hpp"
#include "change_set.hpp"
#include "config_manager.hpp"
#include "data_source.hpp"
#include "dependency_tracker.hpp"
#include "in_memory_store.hpp"
#include "lock_utils.hpp"
#include "persistent_store_wrapper.hpp"
#include "status_provider.hpp"
#include "store_result.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace flagstore {

enum class ActiveStoreMode { MEMORY, PERSISTENT };

const char *activeStoreModeToString(ActiveStoreMode mode);

/**
 * @brief Serves evaluation reads and applies incoming change sets
 *
 * Reads go to the persistent store until the first full data set has been
 * applied; from then on the in-memory store is authoritative. Change sets are
 * applied under an exclusive lock. Flag change and change set notifications
 * are sent after that lock has been released, so listeners may call back into
 * the store.
 */
class Store : public SelectorStore {
public:
  using FlagChangeBroadcaster = Broadcaster<std::string>;
  using ChangeSetBroadcaster = Broadcaster<ChangeSet>;

  explicit Store(
      std::shared_ptr<FlagChangeBroadcaster> flagChangeBroadcaster = nullptr,
      std::shared_ptr<ChangeSetBroadcaster> changeSetBroadcaster = nullptr,
      std::chrono::milliseconds lockTimeout = std::chrono::milliseconds(5000));
  ~Store() override;

  Store(const Store &) = delete;
  Store &operator=(const Store &) = delete;

  // Builds a store from data_store.* settings, wrapping persistentStore when
  // one is given
  static std::shared_ptr<Store>
  create(const DataStoreConfig &config,
         std::shared_ptr<PersistentDataStore> persistentStore = nullptr);

  Store &withPersistence(std::shared_ptr<PersistentStoreWrapper> wrapper,
                         bool writable,
                         std::shared_ptr<DataStoreStatusProvider> statusProvider);

  void apply(const ChangeSet &changeSet, bool persist);

  // Writes the current memory contents to the persistent store
  StoreResult<void> commit();

  std::shared_ptr<const ReadOnlyStore> getActiveStore() const;
  ActiveStoreMode getActiveStoreMode() const;
  bool initialized() const;
  Selector selector() const override;

  std::shared_ptr<DataStoreStatusProvider> getDataStoreStatusProvider() const;
  std::shared_ptr<FlagChangeBroadcaster> getFlagChangeBroadcaster() const {
    return flagChangeBroadcaster_;
  }
  std::shared_ptr<ChangeSetBroadcaster> getChangeSetBroadcaster() const {
    return changeSetBroadcaster_;
  }

  void close();

private:
  struct ApplyOutcome {
    bool broadcastChangeSet = false;
    std::vector<std::string> changedFlagKeys;
  };

  static RawCollections changesToCollections(const std::vector<Change> &changes);

  // Both run with the write lock held
  bool setBasis(const RawCollections &collections, const Selector &selector,
                bool persist, KindAndKeySet &affectedOut);
  bool applyDelta(const RawCollections &collections, const Selector &selector,
                  bool persist, KindAndKeySet &affectedOut);

  bool shouldPersist() const;
  void resetDependencyTracker(const RawCollections &collections);
  KindAndKeySet computeChangedItems(const ItemCollections &oldData,
                                    const RawCollections &newData) const;

  mutable ContainerSharedMutex mutex_;
  std::chrono::milliseconds lockTimeout_;

  std::shared_ptr<FlagChangeBroadcaster> flagChangeBroadcaster_;
  std::shared_ptr<ChangeSetBroadcaster> changeSetBroadcaster_;

  std::shared_ptr<InMemoryStore> memoryStore_;
  DependencyTracker dependencyTracker_;

  std::shared_ptr<PersistentStoreWrapper> persistentStore_;
  std::shared_ptr<DataStoreStatusProvider> statusProvider_;
  bool persistentStoreWritable_ = false;

  ActiveStoreMode activeMode_ = ActiveStoreMode::MEMORY;
  bool persist_ = false;
  Selector selector_;
};

} // namespace flagstore
