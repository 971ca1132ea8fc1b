#include <gtest/gtest.h>
#include "config_manager.hpp"
#include <cstdio>
#include <fstream>

namespace flagstore {

class ConfigManagerTest : public ::testing::Test {
protected:
    ConfigManager& config() { return ConfigManager::getInstance(); }

    void TearDown() override {
        config().loadConfigFromString("{}");
    }
};

TEST_F(ConfigManagerTest, FlattensNestedKeys) {
    ASSERT_TRUE(config().loadConfigFromString(R"({
        "data_store": {"mode": "read_only", "poll_interval_ms": 250},
        "logging": {"level": "debug", "component_filter": ["Store", "InMemoryStore"]},
        "ratio": 0.25
    })"));

    EXPECT_EQ(config().getString("data_store.mode"), "read_only");
    EXPECT_EQ(config().getInt("data_store.poll_interval_ms"), 250);
    EXPECT_DOUBLE_EQ(config().getDouble("ratio"), 0.25);
    EXPECT_TRUE(config().hasKey("logging.level"));
    EXPECT_FALSE(config().hasKey("logging.missing"));
    EXPECT_EQ(config().getString("logging.missing", "fallback"), "fallback");
    EXPECT_EQ(config().getStringSet("logging.component_filter"), (StringSet{"Store", "InMemoryStore"}));
}

TEST_F(ConfigManagerTest, RejectsInvalidDocuments) {
    EXPECT_FALSE(config().loadConfigFromString("not json"));
    EXPECT_FALSE(config().loadConfigFromString("[1, 2]"));
}

TEST_F(ConfigManagerTest, LoadsFromFileAndReloads) {
    std::string path = "flagstore_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"data_store": {"lock_timeout_ms": 1500}})";
    }
    ASSERT_TRUE(config().loadConfig(path));
    EXPECT_EQ(config().getDataStoreConfig().lockTimeout, std::chrono::milliseconds(1500));

    {
        std::ofstream out(path);
        out << R"({"data_store": {"lock_timeout_ms": 900}})";
    }
    ASSERT_TRUE(config().reloadConfiguration());
    EXPECT_EQ(config().getDataStoreConfig().lockTimeout, std::chrono::milliseconds(900));
    std::remove(path.c_str());

    EXPECT_FALSE(config().loadConfig("does-not-exist.json"));
}

TEST_F(ConfigManagerTest, DataStoreDefaults) {
    auto storeConfig = config().getDataStoreConfig();

    EXPECT_EQ(storeConfig, DataStoreConfig{});
    EXPECT_TRUE(storeConfig.writable());
    EXPECT_EQ(storeConfig.pollInterval, std::chrono::milliseconds(500));
    EXPECT_TRUE(storeConfig.validate().isValid);
}

TEST_F(ConfigManagerTest, DataStoreValidation) {
    ASSERT_TRUE(config().loadConfigFromString(R"({
        "data_store": {"mode": "READ_ONLY", "poll_interval_ms": 0, "lock_timeout_ms": -1}
    })"));

    auto storeConfig = config().getDataStoreConfig();
    EXPECT_FALSE(storeConfig.writable());

    auto result = config().validateConfiguration();
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.errors.size(), 2u);

    DataStoreConfig slowPolling;
    slowPolling.pollInterval = std::chrono::milliseconds(120000);
    auto slowResult = slowPolling.validate();
    EXPECT_TRUE(slowResult.isValid);
    EXPECT_EQ(slowResult.warnings.size(), 1u);
}

TEST_F(ConfigManagerTest, RedisSection) {
    ASSERT_TRUE(config().loadConfigFromString(R"({
        "redis": {"host": "cache.internal", "port": 70000, "prefix": "flags"}
    })"));

    auto redis = config().getRedisStoreConfig();
    EXPECT_EQ(redis.host, "cache.internal");
    EXPECT_EQ(redis.prefix, "flags");
    EXPECT_EQ(redis.db, 0);

    auto result = config().validateConfiguration();
    EXPECT_FALSE(result.isValid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].find("redis.port"), std::string::npos);
}

TEST_F(ConfigManagerTest, LoggingConfig) {
    ASSERT_TRUE(config().loadConfigFromString(R"({
        "logging": {"level": "warn", "format": "json", "console_output": false, "async_logging": true}
    })"));

    auto logging = config().getLoggingConfig();
    EXPECT_EQ(logging.level, LogLevel::WARN);
    EXPECT_EQ(logging.format, LogFormat::JSON);
    EXPECT_FALSE(logging.consoleOutput);
    EXPECT_FALSE(logging.fileOutput);
    EXPECT_TRUE(logging.asyncLogging);
}

TEST_F(ConfigManagerTest, ValidatedValue) {
    ASSERT_TRUE(config().loadConfigFromString(R"({"redis": {"port": 99999}})"));

    auto port = config().getValidatedValue<int>("redis.port", 6379,
                                                [](const int& value) { return value > 0 && value < 65536; });
    EXPECT_EQ(port, 6379);
    EXPECT_EQ(config().getValidatedValue<std::string>("redis.host", "localhost"), "localhost");
}

} // namespace flagstore
