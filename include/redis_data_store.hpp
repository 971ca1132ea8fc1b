#pragma once

#ifdef FLAGSTORE_ENABLE_REDIS
#include <hiredis/hiredis.h>
#endif

#include "config_manager.hpp"
#include "persistent_data_store.hpp"
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#ifdef FLAGSTORE_ENABLE_REDIS

namespace flagstore {

/**
 * @brief PersistentDataStore backed by Redis
 *
 * Each kind is a hash "<prefix>:<namespace>" mapping item keys to JSON, and
 * "<prefix>:$inited" marks an initialized data set. The connection is opened
 * lazily and dropped after any transport error so the next call reconnects.
 *
 * Thread-safety: hiredis contexts are not thread-safe, so every command runs
 * under mutex_.
 */
class RedisDataStore : public PersistentDataStore,
                       public StoreAvailabilityProbe {
public:
  explicit RedisDataStore(const RedisStoreConfig &config);
  ~RedisDataStore() override;

  RedisDataStore(const RedisDataStore &) = delete;
  RedisDataStore &operator=(const RedisDataStore &) = delete;

  void init(const SortedCollections &allData) override;
  std::optional<nlohmann::json> get(DataKind kind,
                                    const std::string &key) override;
  RawItemMap all(DataKind kind) override;
  bool upsert(DataKind kind, const nlohmann::json &item) override;
  bool initialized() override;
  void stop() override;

  bool monitoringEnabled() const override { return true; }
  // PING; never throws
  bool isAvailable() override;

  std::string itemsKey(DataKind kind) const;
  std::string initedKey() const;

private:
  using ReplyPtr = std::unique_ptr<redisReply, void (*)(void *)>;

  static constexpr int MAX_UPSERT_ATTEMPTS = 10;

  // Both expect mutex_ to be held and throw SystemException on failure
  void ensureConnected();
  ReplyPtr command(const std::vector<std::string> &args);
  void discardTransaction();
  void unwatch();

  RedisStoreConfig config_;
  std::unique_ptr<redisContext, decltype(&redisFree)> context_;
  std::mutex mutex_;
};

} // namespace flagstore

#endif // FLAGSTORE_ENABLE_REDIS
