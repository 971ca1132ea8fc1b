#pragma once

#include "broadcaster.hpp"
#include "data_source.hpp"
#include "persistent_data_store.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace flagstore {

struct DataStoreStatus {
  bool available = true;
  // Data in the persistent store may be behind the in-memory data
  bool stale = false;

  bool operator==(const DataStoreStatus &other) const {
    return available == other.available && stale == other.stale;
  }
  bool operator!=(const DataStoreStatus &other) const {
    return !(*this == other);
  }
};

struct DataSourceStatus {
  DataSourceState state = DataSourceState::INITIALIZING;
  std::chrono::system_clock::time_point stateSince =
      std::chrono::system_clock::now();
  std::optional<DataSourceErrorInfo> lastError;

  bool operator==(const DataSourceStatus &other) const {
    return state == other.state && stateSince == other.stateSince &&
           lastError == other.lastError;
  }
  bool operator!=(const DataSourceStatus &other) const {
    return !(*this == other);
  }
};

// Receives availability transitions from the persistent store wrapper
class DataStoreUpdateSink {
public:
  virtual ~DataStoreUpdateSink() = default;
  virtual void updateStatus(const DataStoreStatus &status) = 0;
};

/**
 * @brief Latest status value plus a broadcaster for changes to it
 *
 * Listeners are only notified when a new value differs from the stored one.
 */
template <typename Status> class StatusProvider {
public:
  using Listener = typename Broadcaster<Status>::Listener;
  // Returns the next status, or nothing to keep the current one
  using Transition = std::function<std::optional<Status>(const Status &)>;

  explicit StatusProvider(Status initial, std::string name = "StatusProvider")
      : status_(std::move(initial)), broadcaster_(name), name_(std::move(name)) {}

  Status status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
  }

  bool updateStatus(const Status &newStatus) {
    return update([&newStatus](const Status &) { return newStatus; });
  }

  bool update(const Transition &transition) {
    std::optional<Status> toBroadcast;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto next = transition(status_);
      if (!next || *next == status_) {
        return false;
      }
      status_ = *next;
      toBroadcast = status_;
    }
    STATUS_LOG_DEBUG("{} status changed", name_);
    broadcaster_.broadcast(*toBroadcast);
    return true;
  }

  ListenerId addListener(Listener listener) {
    return broadcaster_.addListener(std::move(listener));
  }
  bool removeListener(ListenerId id) { return broadcaster_.removeListener(id); }
  bool hasListeners() const { return broadcaster_.hasListeners(); }

private:
  mutable std::mutex mutex_;
  Status status_;
  Broadcaster<Status> broadcaster_;
  std::string name_;
};

/**
 * Availability of the persistent store. Starts as {available, not stale}.
 */
class DataStoreStatusProvider : public DataStoreUpdateSink {
public:
  explicit DataStoreStatusProvider(
      std::shared_ptr<PersistentDataStore> store = nullptr);

  DataStoreStatus status() const { return provider_.status(); }
  void updateStatus(const DataStoreStatus &status) override;

  // True only for stores that expose an enabled availability probe
  bool monitoringEnabled() const;

  ListenerId addListener(StatusProvider<DataStoreStatus>::Listener listener) {
    return provider_.addListener(std::move(listener));
  }
  bool removeListener(ListenerId id) { return provider_.removeListener(id); }

private:
  std::shared_ptr<PersistentDataStore> store_;
  StatusProvider<DataStoreStatus> provider_;
};

/**
 * Connection state of the update source.
 *
 * INTERRUPTED reported before the first VALID keeps the state INITIALIZING,
 * and the state never returns to INITIALIZING once it has left it.
 * stateSince only moves when the state changes; an update without an error
 * keeps the previous lastError.
 */
class DataSourceStatusProvider {
public:
  DataSourceStatusProvider();

  DataSourceStatus status() const { return provider_.status(); }
  void updateStatus(DataSourceState newState,
                    const std::optional<DataSourceErrorInfo> &newError =
                        std::nullopt);

  ListenerId addListener(StatusProvider<DataSourceStatus>::Listener listener) {
    return provider_.addListener(std::move(listener));
  }
  bool removeListener(ListenerId id) { return provider_.removeListener(id); }

private:
  StatusProvider<DataSourceStatus> provider_;
};

} // namespace flagstore
