#pragma once

#include "exceptions.hpp"
#include "logger.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace flagstore {

using ListenerId = uint64_t;

/**
 * @brief Synchronous fan-out of values to registered listeners
 *
 * Listeners run on the broadcasting thread in registration order, outside the
 * broadcaster's lock. A listener that throws is logged and skipped.
 */
template <typename T> class Broadcaster {
public:
  using Listener = std::function<void(const T &)>;

  explicit Broadcaster(std::string name = "Broadcaster")
      : name_(std::move(name)) {}

  ListenerId addListener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = nextId_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
  }

  bool removeListener(ListenerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
      if (it->first == id) {
        listeners_.erase(it);
        return true;
      }
    }
    return false;
  }

  bool hasListeners() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !listeners_.empty();
  }

  size_t listenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
  }

  void broadcast(const T &value) const {
    std::vector<std::pair<ListenerId, Listener>> snapshot;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      snapshot = listeners_;
    }
    for (const auto &[id, listener] : snapshot) {
      try {
        listener(value);
      } catch (const FlagStoreException &e) {
        LOG_ERROR(name_, "Listener " + std::to_string(id) +
                             " failed: " + e.toLogString());
      } catch (const std::exception &e) {
        LOG_ERROR(name_, "Listener " + std::to_string(id) +
                             " failed: " + std::string(e.what()));
      }
    }
  }

private:
  std::string name_;
  mutable std::mutex mutex_;
  std::vector<std::pair<ListenerId, Listener>> listeners_;
  ListenerId nextId_ = 1;
};

} // namespace flagstore
