#pragma once

#include "data_source.hpp"
#include "status_provider.hpp"
#include "store.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace flagstore {

/**
 * @brief Feeds data from initializers and a synchronizer into a Store
 *
 * Also performs persistent store outage recovery: when the data store
 * status reports the store available again with possibly stale data, the
 * in-memory contents are committed to it.
 */
class UpdateProcessor {
public:
  explicit UpdateProcessor(
      std::shared_ptr<Store> store,
      std::shared_ptr<DataSourceStatusProvider> sourceStatus = nullptr);
  ~UpdateProcessor();

  UpdateProcessor(const UpdateProcessor &) = delete;
  UpdateProcessor &operator=(const UpdateProcessor &) = delete;

  // Applies the basis; returns true if it identifies a defined selector
  bool applyBasis(const Basis &basis);

  // Tries each initializer in order until one yields a basis with a selector
  bool runInitializers(
      const std::vector<std::shared_ptr<Initializer>> &initializers);

  // Returns false when the update stream should end
  bool handleUpdate(const Update &update);

  // Blocks until the synchronizer finishes, reports OFF, or stop() is called
  void runSynchronizer(Synchronizer &synchronizer);

  void stop();

  bool isReady() const { return ready_.load(); }
  bool isStopped() const { return stopped_.load(); }
  std::optional<std::string> getEnvironmentId() const;
  std::shared_ptr<DataSourceStatusProvider> getDataSourceStatusProvider() const {
    return sourceStatus_;
  }

private:
  // Shared with the status listener; cleared under its mutex on destruction
  // so a broadcast already in flight finishes before members go away.
  struct ListenerGuard {
    std::mutex mutex;
    bool active = true;
  };

  void onDataStoreStatus(const DataStoreStatus &status);

  std::shared_ptr<Store> store_;
  std::shared_ptr<DataSourceStatusProvider> sourceStatus_;
  std::shared_ptr<DataStoreStatusProvider> storeStatus_;
  std::optional<ListenerId> storeStatusListener_;
  std::shared_ptr<ListenerGuard> listenerGuard_;

  std::atomic<bool> ready_{false};
  std::atomic<bool> stopped_{false};

  mutable std::mutex mutex_;
  Synchronizer *activeSynchronizer_ = nullptr;
  std::optional<std::string> environmentId_;
};

} // namespace flagstore
