#include <gtest/gtest.h>
#include "redis_data_store.hpp"

#ifdef FLAGSTORE_ENABLE_REDIS

#include "data_set_sorter.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <unistd.h>

namespace flagstore {

using testing::flagJson;

// Needs a Redis server at 127.0.0.1:6379; skipped when none answers.
class RedisDataStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.prefix = "flagstore-test-" + std::to_string(::getpid()) + "-" +
                        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        store = std::make_unique<RedisDataStore>(config);
        if (!store->isAvailable()) {
            GTEST_SKIP() << "Redis is not reachable at " << config.host << ":" << config.port;
        }
        other = std::make_unique<RedisDataStore>(config);
        raw.reset(redisConnect(config.host.c_str(), config.port));
        ASSERT_TRUE(raw && !raw->err);
    }

    void TearDown() override {
        if (raw && !raw->err) {
            for (auto kind : ALL_DATA_KINDS) {
                freeReplyObject(redisCommand(raw.get(), "DEL %s", store->itemsKey(kind).c_str()));
            }
            freeReplyObject(redisCommand(raw.get(), "DEL %s", store->initedKey().c_str()));
        }
    }

    void rawSet(DataKind kind, const std::string& key, const std::string& value) {
        freeReplyObject(redisCommand(raw.get(), "HSET %s %s %s", store->itemsKey(kind).c_str(), key.c_str(),
                                     value.c_str()));
    }

    static SortedCollections fullDataSet() {
        RawCollections data;
        data[DataKind::FLAGS].emplace("a", flagJson("a", 1));
        data[DataKind::SEGMENTS];
        return DataSetSorter::sortAllCollections(data);
    }

    RedisStoreConfig config;
    std::unique_ptr<RedisDataStore> store;
    std::unique_ptr<RedisDataStore> other;
    std::unique_ptr<redisContext, decltype(&redisFree)> raw{nullptr, redisFree};
};

TEST_F(RedisDataStoreTest, UpsertWritesNewerVersionOnly) {
    EXPECT_TRUE(store->upsert(DataKind::FLAGS, flagJson("a", 2)));
    EXPECT_FALSE(store->upsert(DataKind::FLAGS, flagJson("a", 1)));
    EXPECT_FALSE(store->upsert(DataKind::FLAGS, flagJson("a", 2)));

    auto stored = store->get(DataKind::FLAGS, "a");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ((*stored)["version"], 2);
}

TEST_F(RedisDataStoreTest, SkippedUpsertDoesNotAbortNextTransaction) {
    ASSERT_TRUE(store->upsert(DataKind::FLAGS, flagJson("a", 5)));
    EXPECT_FALSE(store->upsert(DataKind::FLAGS, flagJson("a", 4)));

    // Another writer touches the same hash before this connection's next transaction
    ASSERT_TRUE(other->upsert(DataKind::FLAGS, flagJson("b", 1)));

    EXPECT_NO_THROW(store->init(fullDataSet()));
    EXPECT_TRUE(store->initialized());
}

TEST_F(RedisDataStoreTest, FailedUpsertDoesNotAbortNextTransaction) {
    rawSet(DataKind::FLAGS, "a", "{not json");
    EXPECT_THROW(store->upsert(DataKind::FLAGS, flagJson("a", 2)), std::exception);

    ASSERT_TRUE(other->upsert(DataKind::FLAGS, flagJson("b", 1)));

    EXPECT_NO_THROW(store->init(fullDataSet()));
    auto stored = store->get(DataKind::FLAGS, "a");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ((*stored)["version"], 1);
}

} // namespace flagstore

#endif // FLAGSTORE_ENABLE_REDIS
