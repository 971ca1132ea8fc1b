#pragma once

#include "broadcaster.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flagstore {

/**
 * Subscription front end for flag change notifications. Every listener added
 * through the tracker is removed from the broadcaster when the tracker is
 * destroyed.
 */
class FlagTracker {
public:
  using FlagChangeListener = std::function<void(const std::string &)>;

  explicit FlagTracker(std::shared_ptr<Broadcaster<std::string>> flagChanges);
  ~FlagTracker();

  FlagTracker(const FlagTracker &) = delete;
  FlagTracker &operator=(const FlagTracker &) = delete;

  // Called with the key of every flag whose configuration may have changed
  ListenerId addFlagChangeListener(FlagChangeListener listener);

  // Called only when the given flag may have changed
  ListenerId addKeyListener(const std::string &flagKey,
                            FlagChangeListener listener);

  bool removeListener(ListenerId id);

private:
  std::shared_ptr<Broadcaster<std::string>> flagChanges_;
  std::mutex mutex_;
  std::vector<ListenerId> listenerIds_;

  ListenerId track(ListenerId id);
};

} // namespace flagstore
