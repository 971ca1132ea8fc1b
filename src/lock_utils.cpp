#include "lock_utils.hpp"
#include <algorithm>
#include <sstream>
#include <thread>

namespace flagstore {

std::atomic<bool> LockOrderGuard::enabled_{true};

std::vector<std::pair<LockLevel, std::string>>& LockOrderGuard::held() {
    thread_local std::vector<std::pair<LockLevel, std::string>> locks;
    return locks;
}

void LockOrderGuard::checkOrder(LockLevel level, const std::string& mutexId) {
    if (!enabled_.load()) return;

    for (const auto& [heldLevel, heldId] : held()) {
        if (static_cast<int>(heldLevel) > static_cast<int>(level)) {
            std::ostringstream oss;
            oss << "Lock ordering violation: thread " << std::this_thread::get_id()
                << " holds level " << static_cast<int>(heldLevel)
                << " (mutex: " << heldId << ") while acquiring level "
                << static_cast<int>(level) << " (mutex: " << mutexId << ")";
            throw LockOrderException(oss.str());
        }
    }
}

void LockOrderGuard::push(LockLevel level, const std::string& mutexId) {
    held().emplace_back(level, mutexId);
}

void LockOrderGuard::pop(LockLevel level, const std::string& mutexId) {
    auto& locks = held();
    auto it = std::find(locks.rbegin(), locks.rend(), std::make_pair(level, mutexId));
    if (it != locks.rend()) {
        locks.erase(std::next(it).base());
    }
}

std::vector<std::pair<LockLevel, std::string>> LockOrderGuard::heldByCurrentThread() {
    return held();
}

} // namespace flagstore
