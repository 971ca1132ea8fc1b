#pragma once

#include "data_kind.hpp"
#include "lock_utils.hpp"
#include "persistent_data_store.hpp"
#include "read_only_store.hpp"
#include "status_provider.hpp"
#include "store_item.hpp"
#include "store_result.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace flagstore {

namespace net = boost::asio;

/**
 * @brief Availability tracking in front of a PersistentDataStore
 *
 * Every store call is made through this wrapper. When the store supports
 * monitoring, a failed call marks the store unavailable and starts a recovery
 * poller that probes the store on a steady_timer until it answers again.
 * Availability transitions are reported to the status sink as
 * {available, stale: true}.
 *
 * The poller runs on a thread owned by the wrapper. Timer state is only
 * touched from that thread.
 */
class PersistentStoreWrapper : public ReadOnlyStore {
public:
  PersistentStoreWrapper(
      std::shared_ptr<PersistentDataStore> store,
      std::shared_ptr<DataStoreUpdateSink> statusSink,
      std::chrono::milliseconds pollInterval = std::chrono::milliseconds(500));
  ~PersistentStoreWrapper() override;

  PersistentStoreWrapper(const PersistentStoreWrapper &) = delete;
  PersistentStoreWrapper &operator=(const PersistentStoreWrapper &) = delete;

  // Sorts the data so prerequisites are written before their dependents
  StoreResult<void> init(const RawCollections &allData);

  // Raw lookups; tombstones are returned as stored
  StoreResult<std::optional<StoreItem>> tryGet(DataKind kind,
                                               const std::string &key) const;
  StoreResult<ItemMap> tryAll(DataKind kind) const;

  StoreResult<bool> upsert(DataKind kind, const nlohmann::json &item);
  StoreResult<bool> remove(DataKind kind, const std::string &key,
                           int64_t version);

  // ReadOnlyStore view: failures are logged and read as empty
  std::optional<StoreItem> get(DataKind kind,
                               const std::string &key) const override;
  ItemMap all(DataKind kind) const override;
  bool initialized() const override;

  // Stops the poller and the underlying store. Safe to call twice.
  void stop();

  bool monitoringEnabled() const;
  bool isAvailable() const;
  bool isPolling() const;
  std::chrono::milliseconds getPollInterval() const { return pollInterval_; }

private:
  template <typename T, typename Operation>
  StoreResult<T> invoke(const char *operation, Operation &&fn) const;

  void handleFailure(const char *operation,
                     const std::exception_ptr &error) const;
  void updateAvailability(bool available) const;

  // Run on the poller thread
  void schedulePoll(uint64_t generation) const;
  void poll(uint64_t generation) const;

  std::shared_ptr<PersistentDataStore> store_;
  StoreAvailabilityProbe *probe_;
  std::shared_ptr<DataStoreUpdateSink> statusSink_;
  std::chrono::milliseconds pollInterval_;

  // Availability state; reads through the const interface may change it
  mutable StateMutex stateMutex_;
  mutable bool lastAvailable_ = true;
  mutable bool polling_ = false;
  mutable std::atomic<uint64_t> generation_{0};

  mutable net::io_context ioc_;
  net::executor_work_guard<net::io_context::executor_type> workGuard_;
  mutable net::steady_timer pollTimer_;
  std::thread worker_;
  std::atomic<bool> stopped_{false};
};

} // namespace flagstore
