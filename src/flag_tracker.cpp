#include "flag_tracker.hpp"
#include <algorithm>

namespace flagstore {

FlagTracker::FlagTracker(std::shared_ptr<Broadcaster<std::string>> flagChanges)
    : flagChanges_(std::move(flagChanges)) {
    if (!flagChanges_) {
        throw SystemException(ErrorCode::CONFIGURATION_ERROR, "Flag tracker requires a broadcaster", "FlagTracker");
    }
}

FlagTracker::~FlagTracker() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto id : listenerIds_) {
        flagChanges_->removeListener(id);
    }
}

ListenerId FlagTracker::addFlagChangeListener(FlagChangeListener listener) {
    return track(flagChanges_->addListener(std::move(listener)));
}

ListenerId FlagTracker::addKeyListener(const std::string& flagKey, FlagChangeListener listener) {
    return track(flagChanges_->addListener(
        [flagKey, listener = std::move(listener)](const std::string& changedKey) {
            if (changedKey == flagKey) {
                listener(changedKey);
            }
        }));
}

bool FlagTracker::removeListener(ListenerId id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(listenerIds_.begin(), listenerIds_.end(), id);
        if (it == listenerIds_.end()) {
            return false;
        }
        listenerIds_.erase(it);
    }
    return flagChanges_->removeListener(id);
}

ListenerId FlagTracker::track(ListenerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listenerIds_.push_back(id);
    return id;
}

} // namespace flagstore
