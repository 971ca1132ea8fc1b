#include <gtest/gtest.h>
#include "component_logger.hpp"
#include "log_handler.hpp"
#include "logger.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <memory>
#include <thread>

using namespace flagstore;
using flagstore::testing::CapturingLogHandler;
using flagstore::testing::ScopedLogCapture;

class LogHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        handler_ = std::make_unique<CapturingLogHandler>("MockHandler");
    }

    std::unique_ptr<CapturingLogHandler> handler_;
};

TEST_F(LogHandlerTest, HandlerId) {
    EXPECT_EQ(handler_->getId(), "MockHandler");
}

TEST_F(LogHandlerTest, HandleLogEntry) {
    LogEntry entry(LogLevel::INFO, "Store", "Test message");

    handler_->handle(entry);

    auto entries = handler_->getEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::INFO);
    EXPECT_EQ(entries[0].component, "Store");
    EXPECT_EQ(entries[0].message, "Test message");
}

TEST_F(LogHandlerTest, LevelToString) {
    EXPECT_EQ(LogHandler::levelToString(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(LogHandler::levelToString(LogLevel::WARN), "WARN");
    EXPECT_EQ(LogHandler::levelToString(LogLevel::ERROR), "ERROR");
}

TEST_F(LogHandlerTest, FileHandlerWritesEntries) {
    std::string path = "flagstore_test_handler.log";
    std::remove(path.c_str());
    {
        FileLogHandler fileHandler("file-test", path, LogFormat::TEXT, LogLevel::INFO);
        ASSERT_TRUE(fileHandler.isOpen());

        LogEntry debugEntry(LogLevel::DEBUG, "Store", "filtered out");
        EXPECT_FALSE(fileHandler.shouldHandle(debugEntry));

        fileHandler.handle(LogEntry(LogLevel::WARN, "Store", "written to file"));
        fileHandler.flush();
        EXPECT_GT(fileHandler.getFileSize(), 0u);
    }

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("written to file"), std::string::npos);
    std::remove(path.c_str());
}

// Test ComponentLogger template with a mock component
class MockComponent {};

namespace flagstore {
template <> struct ComponentTrait<MockComponent> {
    static constexpr const char* name = "MockComponent";
};
} // namespace flagstore

TEST(ComponentLoggerTest, ComponentNameResolvedAtCompileTime) {
    EXPECT_STREQ(ComponentTrait<MockComponent>::name, "MockComponent");
    EXPECT_STREQ(ComponentLogger<MockComponent>::getComponentName(), "MockComponent");
}

TEST(ComponentLoggerTest, FormatsPlaceholders) {
    ScopedLogCapture capture;

    ComponentLogger<MockComponent>::warn("Item {} at version {} deleted={}", "flag-a", 7, true);

    auto entries = capture.handler().getEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].component, "MockComponent");
    EXPECT_EQ(entries[0].message, "Item flag-a at version 7 deleted=true");
    EXPECT_EQ(entries[0].level, LogLevel::WARN);
}

TEST(ComponentLoggerTest, RespectsLevelAndComponentFilter) {
    ScopedLogCapture capture;
    Logger& logger = Logger::getInstance();

    logger.setLogLevel(LogLevel::WARN);
    STORE_LOG_INFO("dropped by level");
    STORE_LOG_WARN("kept");

    logger.setComponentFilter({"InMemoryStore"});
    STORE_LOG_ERROR("dropped by component");
    logger.setComponentFilter({});

    EXPECT_EQ(capture.handler().countContaining(LogLevel::INFO, "dropped by level"), 0u);
    EXPECT_EQ(capture.handler().countContaining(LogLevel::WARN, "kept"), 1u);
    EXPECT_EQ(capture.handler().countContaining(LogLevel::ERROR, "dropped by component"), 0u);
}

TEST(ComponentLoggerTest, HandlerRegistration) {
    Logger& logger = Logger::getInstance();
    auto handler = std::make_shared<CapturingLogHandler>("registration-test");

    EXPECT_EQ(logger.registerHandler(handler), Logger::HandlerResult::SUCCESS);
    EXPECT_EQ(logger.registerHandler(handler), Logger::HandlerResult::ALREADY_EXISTS);
    EXPECT_EQ(logger.registerHandler(nullptr), Logger::HandlerResult::INVALID_HANDLER);
    EXPECT_TRUE(logger.hasHandler("registration-test"));
    EXPECT_TRUE(logger.unregisterHandler("registration-test"));
    EXPECT_FALSE(logger.unregisterHandler("registration-test"));
}

TEST(ComponentLoggerTest, MetricsCountWarningsAndErrors) {
    ScopedLogCapture capture;
    Logger& logger = Logger::getInstance();
    logger.resetMetrics();

    logger.warn("Store", "warning");
    logger.error("Store", "error");
    logger.info("Store", "info");

    auto metrics = logger.getMetrics();
    EXPECT_EQ(metrics.totalMessages.load(), 3u);
    EXPECT_EQ(metrics.warningCount.load(), 1u);
    EXPECT_EQ(metrics.errorCount.load(), 1u);
}

// Test thread safety of component logging
TEST(ComponentLoggerTest, ThreadSafety) {
    ScopedLogCapture capture;
    const int numThreads = 5;
    const int messagesPerThread = 50;

    std::vector<std::thread> threads;
    for (int i = 0; i < numThreads; ++i) {
        threads.emplace_back([i, messagesPerThread]() {
            for (int j = 0; j < messagesPerThread; ++j) {
                STORE_LOG_INFO("Thread {} message {}", i, j);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(capture.handler().getEntries().size(), static_cast<size_t>(numThreads * messagesPerThread));
}

TEST(ComponentLoggerTest, AsyncLoggingDrainsOnStop) {
    ScopedLogCapture capture;
    Logger& logger = Logger::getInstance();

    logger.enableAsyncLogging(true);
    for (int i = 0; i < 100; ++i) {
        MEMSTORE_LOG_DEBUG("async message {}", i);
    }
    logger.enableAsyncLogging(false);

    EXPECT_EQ(capture.handler().countContaining(LogLevel::DEBUG, "async message"), 100u);
}
