#pragma once

#include "exceptions.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <vector>

namespace flagstore {

/**
 * @brief Exception thrown when lock acquisition times out
 */
class LockTimeoutException : public SystemException {
public:
  explicit LockTimeoutException(const std::string &message)
      : SystemException(ErrorCode::LOCK_TIMEOUT, message, "LockUtils") {}
};

/**
 * @brief Exception thrown when a thread acquires locks out of level order
 */
class LockOrderException : public SystemException {
public:
  explicit LockOrderException(const std::string &message)
      : SystemException(ErrorCode::LOCK_TIMEOUT, message, "LockUtils") {}
};

/**
 * @brief Lock ordering levels
 *
 * A thread may only acquire a lock whose level is greater than or equal to
 * every level it already holds. The store hierarchy maps onto the levels as:
 * Store (CONTAINER) -> InMemoryStore (RESOURCE) -> availability state (STATE).
 */
enum class LockLevel : int {
  CONFIG = 1,    // Configuration
  CONTAINER = 2, // Store orchestration
  RESOURCE = 3,  // Item collections
  STATE = 4      // Individual object state
};

/**
 * @brief Timed mutex tagged with its lock level
 */
template <LockLevel Level> class OrderedMutex : public std::timed_mutex {
public:
  static constexpr LockLevel level = Level;

  OrderedMutex() : id_(generateId()) {}

  const std::string &getId() const { return id_; }
  LockLevel getLevel() const { return Level; }

private:
  std::string id_;
  static std::atomic<uint64_t> counter_;

  static std::string generateId() {
    return "mutex_" + std::to_string(counter_.fetch_add(1));
  }
};

template <LockLevel Level>
std::atomic<uint64_t> OrderedMutex<Level>::counter_{0};

/**
 * @brief Reader/writer variant of OrderedMutex
 */
template <LockLevel Level>
class OrderedSharedMutex : public std::shared_timed_mutex {
public:
  static constexpr LockLevel level = Level;

  OrderedSharedMutex() : id_(generateId()) {}

  const std::string &getId() const { return id_; }
  LockLevel getLevel() const { return Level; }

private:
  std::string id_;
  static std::atomic<uint64_t> counter_;

  static std::string generateId() {
    return "shared_mutex_" + std::to_string(counter_.fetch_add(1));
  }
};

template <LockLevel Level>
std::atomic<uint64_t> OrderedSharedMutex<Level>::counter_{0};

using ConfigMutex = OrderedMutex<LockLevel::CONFIG>;
using ContainerMutex = OrderedMutex<LockLevel::CONTAINER>;
using ResourceMutex = OrderedMutex<LockLevel::RESOURCE>;
using StateMutex = OrderedMutex<LockLevel::STATE>;

using ConfigSharedMutex = OrderedSharedMutex<LockLevel::CONFIG>;
using ContainerSharedMutex = OrderedSharedMutex<LockLevel::CONTAINER>;
using ResourceSharedMutex = OrderedSharedMutex<LockLevel::RESOURCE>;
using StateSharedMutex = OrderedSharedMutex<LockLevel::STATE>;

template <typename T, typename = void>
struct has_lock_level : std::false_type {};

template <typename T>
struct has_lock_level<T, std::void_t<decltype(T::level)>> : std::true_type {};

/**
 * @brief Per-thread record of held lock levels
 */
class LockOrderGuard {
public:
  // Throws LockOrderException if the calling thread holds a higher level
  static void checkOrder(LockLevel level, const std::string &mutexId);
  static void push(LockLevel level, const std::string &mutexId);
  static void pop(LockLevel level, const std::string &mutexId);

  static std::vector<std::pair<LockLevel, std::string>> heldByCurrentThread();

  static void setEnabled(bool enabled) { enabled_ = enabled; }
  static bool isEnabled() { return enabled_; }

private:
  static std::vector<std::pair<LockLevel, std::string>> &held();
  static std::atomic<bool> enabled_;
};

namespace detail {

template <typename Mutex> std::string mutexIdOf(const Mutex &mutex) {
  if constexpr (has_lock_level<Mutex>::value) {
    return mutex.getId();
  } else {
    return "unordered_" + std::to_string(reinterpret_cast<uintptr_t>(&mutex));
  }
}

} // namespace detail

/**
 * @brief RAII exclusive lock with timeout and level-order checking
 */
template <typename Mutex> class ScopedTimedLock {
public:
  using mutex_type = Mutex;

  explicit ScopedTimedLock(
      Mutex &mutex,
      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000),
      const std::string &lockName = "")
      : mutex_(mutex), locked_(false),
        lockName_(lockName.empty() ? detail::mutexIdOf(mutex) : lockName) {

    if constexpr (has_lock_level<Mutex>::value) {
      LockOrderGuard::checkOrder(Mutex::level, mutex_.getId());
    }

    locked_ = mutex_.try_lock_for(timeout);
    if (!locked_) {
      throw LockTimeoutException("Failed to acquire lock '" + lockName_ +
                                 "' within " + std::to_string(timeout.count()) +
                                 "ms");
    }

    if constexpr (has_lock_level<Mutex>::value) {
      LockOrderGuard::push(Mutex::level, mutex_.getId());
    }
  }

  ~ScopedTimedLock() {
    if (locked_) {
      if constexpr (has_lock_level<Mutex>::value) {
        LockOrderGuard::pop(Mutex::level, mutex_.getId());
      }
      mutex_.unlock();
    }
  }

  ScopedTimedLock(const ScopedTimedLock &) = delete;
  ScopedTimedLock &operator=(const ScopedTimedLock &) = delete;
  ScopedTimedLock(ScopedTimedLock &&) = delete;
  ScopedTimedLock &operator=(ScopedTimedLock &&) = delete;

  bool owns_lock() const { return locked_; }
  const std::string &getLockName() const { return lockName_; }

private:
  Mutex &mutex_;
  bool locked_;
  std::string lockName_;
};

/**
 * @brief RAII shared lock for readers
 */
template <typename SharedMutex> class ScopedTimedSharedLock {
public:
  using mutex_type = SharedMutex;

  explicit ScopedTimedSharedLock(
      SharedMutex &mutex,
      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000),
      const std::string &lockName = "")
      : mutex_(mutex), locked_(false),
        lockName_(lockName.empty() ? detail::mutexIdOf(mutex) : lockName) {

    if constexpr (has_lock_level<SharedMutex>::value) {
      LockOrderGuard::checkOrder(SharedMutex::level, mutex_.getId());
    }

    locked_ = mutex_.try_lock_shared_for(timeout);
    if (!locked_) {
      throw LockTimeoutException("Failed to acquire shared lock '" +
                                 lockName_ + "' within " +
                                 std::to_string(timeout.count()) + "ms");
    }

    if constexpr (has_lock_level<SharedMutex>::value) {
      LockOrderGuard::push(SharedMutex::level, mutex_.getId());
    }
  }

  ~ScopedTimedSharedLock() {
    if (locked_) {
      if constexpr (has_lock_level<SharedMutex>::value) {
        LockOrderGuard::pop(SharedMutex::level, mutex_.getId());
      }
      mutex_.unlock_shared();
    }
  }

  ScopedTimedSharedLock(const ScopedTimedSharedLock &) = delete;
  ScopedTimedSharedLock &operator=(const ScopedTimedSharedLock &) = delete;
  ScopedTimedSharedLock(ScopedTimedSharedLock &&) = delete;
  ScopedTimedSharedLock &operator=(ScopedTimedSharedLock &&) = delete;

  bool owns_lock() const { return locked_; }
  const std::string &getLockName() const { return lockName_; }

private:
  SharedMutex &mutex_;
  bool locked_;
  std::string lockName_;
};

/**
 * @brief RAII shared lock without a deadline
 *
 * Read paths that serve evaluations use this so a writer busy with slow
 * persistent I/O delays readers instead of failing them.
 */
template <typename SharedMutex> class ScopedSharedLock {
public:
  using mutex_type = SharedMutex;

  explicit ScopedSharedLock(SharedMutex &mutex) : mutex_(mutex) {
    if constexpr (has_lock_level<SharedMutex>::value) {
      LockOrderGuard::checkOrder(SharedMutex::level, mutex_.getId());
    }
    mutex_.lock_shared();
    if constexpr (has_lock_level<SharedMutex>::value) {
      LockOrderGuard::push(SharedMutex::level, mutex_.getId());
    }
  }

  ~ScopedSharedLock() {
    if constexpr (has_lock_level<SharedMutex>::value) {
      LockOrderGuard::pop(SharedMutex::level, mutex_.getId());
    }
    mutex_.unlock_shared();
  }

  ScopedSharedLock(const ScopedSharedLock &) = delete;
  ScopedSharedLock &operator=(const ScopedSharedLock &) = delete;
  ScopedSharedLock(ScopedSharedLock &&) = delete;
  ScopedSharedLock &operator=(ScopedSharedLock &&) = delete;

private:
  SharedMutex &mutex_;
};

} // namespace flagstore
