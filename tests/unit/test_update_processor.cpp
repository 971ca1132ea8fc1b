#include <gtest/gtest.h>
#include "update_processor.hpp"
#include "test_helpers.hpp"
#include <deque>
#include <thread>

namespace flagstore {

using testing::MockPersistentStore;
using testing::ScopedLogCapture;
using testing::flagJson;
using testing::waitFor;

namespace {

ChangeSet fullTransfer(const std::vector<std::string>& keys, const Selector& selector) {
    ChangeSetBuilder builder;
    builder.start(IntentCode::TRANSFER_FULL);
    for (const auto& key : keys) {
        builder.addPut(DataKind::FLAGS, key, 1, flagJson(key, 1));
    }
    return builder.finish(selector);
}

class FakeInitializer : public Initializer {
public:
    FakeInitializer(std::string name, BasisResult result) : name_(std::move(name)), result_(std::move(result)) {}

    std::string name() const override { return name_; }

    BasisResult fetch(const SelectorStore&) override {
        ++calls;
        if (throws) {
            throw std::runtime_error("fetch exploded");
        }
        return result_;
    }

    int calls = 0;
    bool throws = false;

private:
    std::string name_;
    BasisResult result_;
};

// Replays queued updates, then blocks until stopped
class FakeSynchronizer : public Synchronizer {
public:
    explicit FakeSynchronizer(std::vector<Update> updates) : updates_(updates.begin(), updates.end()) {}

    std::string name() const override { return "fake-sync"; }

    void sync(const SelectorStore& selectorStore, const UpdateHandler& handler) override {
        startSelector = selectorStore.selector();
        while (!stopped_) {
            if (updates_.empty()) {
                if (!blockWhenDrained) {
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                continue;
            }
            auto update = updates_.front();
            updates_.pop_front();
            ++delivered;
            if (!handler(update)) {
                return;
            }
        }
    }

    void stop() override { stopped_ = true; }

    Selector startSelector;
    std::atomic<int> delivered{0};
    bool blockWhenDrained = false;

private:
    std::deque<Update> updates_;
    std::atomic<bool> stopped_{false};
};

class ThrowingSynchronizer : public Synchronizer {
public:
    std::string name() const override { return "throwing-sync"; }
    void sync(const SelectorStore&, const UpdateHandler&) override { throw std::runtime_error("stream broke"); }
    void stop() override {}
};

Update validUpdate(const ChangeSet& changeSet) {
    Update update;
    update.state = DataSourceState::VALID;
    update.changeSet = changeSet;
    return update;
}

} // namespace

class UpdateProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<Store>();
        processor = std::make_unique<UpdateProcessor>(store);
    }

    void TearDown() override {
        processor.reset();
        store.reset();
    }

    std::shared_ptr<Store> store;
    std::unique_ptr<UpdateProcessor> processor;
};

TEST_F(UpdateProcessorTest, RequiresStore) {
    EXPECT_THROW(UpdateProcessor{nullptr}, SystemException);
}

TEST_F(UpdateProcessorTest, FirstInitializerWithSelectorWins) {
    auto failing = std::make_shared<FakeInitializer>("failing", BasisResult::failure("HTTP 503"));
    auto throwing = std::make_shared<FakeInitializer>("throwing", BasisResult::failure("unused"));
    throwing->throws = true;
    auto good = std::make_shared<FakeInitializer>(
        "good", BasisResult::success(Basis{fullTransfer({"flag-a"}, Selector("s", 3)), false, "env-1"}));
    auto unused = std::make_shared<FakeInitializer>("unused", BasisResult::failure("unused"));

    ScopedLogCapture capture;
    EXPECT_TRUE(processor->runInitializers({failing, throwing, good, unused}));

    EXPECT_EQ(failing->calls, 1);
    EXPECT_EQ(throwing->calls, 1);
    EXPECT_EQ(unused->calls, 0);
    EXPECT_TRUE(processor->isReady());
    EXPECT_EQ(processor->getEnvironmentId(), std::optional<std::string>("env-1"));
    EXPECT_EQ(store->selector(), Selector("s", 3));
    EXPECT_TRUE(store->getActiveStore()->get(DataKind::FLAGS, "flag-a").has_value());
    EXPECT_EQ(capture.handler().countContaining(LogLevel::WARN, "Initializer failing failed: HTTP 503"), 1u);
    EXPECT_EQ(capture.handler().countContaining(LogLevel::ERROR, "fetch exploded"), 1u);
}

TEST_F(UpdateProcessorTest, BasisWithoutSelectorKeepsLooking) {
    auto noSelector = std::make_shared<FakeInitializer>(
        "file", BasisResult::success(Basis{fullTransfer({"from-file"}, Selector::noSelector()), false, std::nullopt}));
    auto withSelector = std::make_shared<FakeInitializer>(
        "polling", BasisResult::success(Basis{fullTransfer({"from-poll"}, Selector("p", 1)), true, std::nullopt}));

    EXPECT_TRUE(processor->runInitializers({noSelector, withSelector}));
    EXPECT_EQ(withSelector->calls, 1);
    EXPECT_TRUE(store->getActiveStore()->get(DataKind::FLAGS, "from-poll").has_value());
}

TEST_F(UpdateProcessorTest, NoUsableInitializer) {
    auto noSelector = std::make_shared<FakeInitializer>(
        "file", BasisResult::success(Basis{fullTransfer({"from-file"}, Selector::noSelector()), false, std::nullopt}));

    EXPECT_FALSE(processor->runInitializers({noSelector, nullptr}));
    EXPECT_FALSE(processor->isReady());
    EXPECT_TRUE(store->initialized());
    EXPECT_EQ(processor->getDataSourceStatusProvider()->status().state, DataSourceState::INITIALIZING);
}

TEST_F(UpdateProcessorTest, SynchronizerUpdatesFlowIntoStore) {
    ChangeSetBuilder builder;
    builder.start(IntentCode::TRANSFER_FULL);
    builder.addPut(DataKind::FLAGS, "flag-a", 1, flagJson("flag-a", 1));
    auto full = builder.finish(Selector("s", 1));
    builder.addPut(DataKind::FLAGS, "flag-a", 2, flagJson("flag-a", 2));
    auto delta = builder.finish(Selector("s", 2));

    Update off;
    off.state = DataSourceState::OFF;
    FakeSynchronizer sync({validUpdate(full), validUpdate(delta), off, validUpdate(full)});

    processor->runSynchronizer(sync);

    EXPECT_EQ(sync.delivered.load(), 3);
    EXPECT_EQ(store->getActiveStore()->get(DataKind::FLAGS, "flag-a")->getVersion(), 2);
    EXPECT_EQ(store->selector(), Selector("s", 2));
    EXPECT_TRUE(processor->isReady());
    EXPECT_EQ(processor->getDataSourceStatusProvider()->status().state, DataSourceState::OFF);
}

TEST_F(UpdateProcessorTest, SynchronizerResumesFromSelector) {
    processor->applyBasis(Basis{fullTransfer({"flag-a"}, Selector("resume", 7)), false, std::nullopt});
    FakeSynchronizer sync({});

    processor->runSynchronizer(sync);

    EXPECT_EQ(sync.startSelector, Selector("resume", 7));
}

TEST_F(UpdateProcessorTest, InterruptionRecordsError) {
    Update interrupted;
    interrupted.state = DataSourceState::INTERRUPTED;
    interrupted.error = DataSourceErrorInfo{DataSourceErrorInfo::Kind::ERROR_RESPONSE, 500, "server error"};
    FakeSynchronizer sync({validUpdate(fullTransfer({"a"}, Selector("s", 1))), interrupted});

    processor->runSynchronizer(sync);

    auto status = processor->getDataSourceStatusProvider()->status();
    EXPECT_EQ(status.state, DataSourceState::INTERRUPTED);
    ASSERT_TRUE(status.lastError.has_value());
    EXPECT_EQ(status.lastError->statusCode, 500);
    EXPECT_TRUE(processor->isReady());
}

TEST_F(UpdateProcessorTest, FallbackRequestEndsSynchronizer) {
    ScopedLogCapture capture;
    auto update = validUpdate(fullTransfer({"a"}, Selector("s", 1)));
    update.fallbackRequested = true;
    FakeSynchronizer sync({update, validUpdate(fullTransfer({"b"}, Selector("s", 2)))});

    processor->runSynchronizer(sync);

    EXPECT_EQ(sync.delivered.load(), 1);
    EXPECT_TRUE(store->getActiveStore()->get(DataKind::FLAGS, "a").has_value());
    EXPECT_EQ(capture.handler().countContaining(LogLevel::WARN, "fallback"), 1u);
}

TEST_F(UpdateProcessorTest, SynchronizerExceptionInterrupts) {
    processor->getDataSourceStatusProvider()->updateStatus(DataSourceState::VALID);
    ThrowingSynchronizer sync;

    processor->runSynchronizer(sync);

    auto status = processor->getDataSourceStatusProvider()->status();
    EXPECT_EQ(status.state, DataSourceState::INTERRUPTED);
    ASSERT_TRUE(status.lastError.has_value());
    EXPECT_EQ(status.lastError->kind, DataSourceErrorInfo::Kind::UNKNOWN);
    EXPECT_EQ(status.lastError->message, "stream broke");
}

TEST_F(UpdateProcessorTest, StopEndsBlockedSynchronizer) {
    FakeSynchronizer sync({validUpdate(fullTransfer({"a"}, Selector("s", 1)))});
    sync.blockWhenDrained = true;

    std::thread runner([&] { processor->runSynchronizer(sync); });
    ASSERT_TRUE(waitFor([&] { return processor->isReady(); }));
    processor->stop();
    runner.join();

    EXPECT_TRUE(processor->isStopped());
    EXPECT_FALSE(processor->handleUpdate(validUpdate(fullTransfer({"b"}, Selector("s", 2)))));
    EXPECT_FALSE(store->getActiveStore()->get(DataKind::FLAGS, "b").has_value());
}

TEST_F(UpdateProcessorTest, RecoveredPersistentStoreIsRefreshed) {
    auto mock = std::make_shared<MockPersistentStore>();
    DataStoreConfig config;
    config.pollInterval = std::chrono::milliseconds(20);
    auto persistentStore = Store::create(config, mock);
    UpdateProcessor recovering(persistentStore);

    recovering.applyBasis(Basis{fullTransfer({"flag-a"}, Selector("s", 1)), true, std::nullopt});
    ASSERT_EQ(mock->getInitCalls(), 1);

    mock->setFailing(true);
    mock->setAvailable(false);
    Update outageUpdate = validUpdate(ChangeSet{IntentCode::TRANSFER_CHANGES,
                                                {Change{ChangeType::PUT, DataKind::FLAGS, "flag-b", 1,
                                                        flagJson("flag-b", 1)}},
                                                Selector("s", 2)});
    EXPECT_TRUE(recovering.handleUpdate(outageUpdate));
    EXPECT_FALSE(persistentStore->getDataStoreStatusProvider()->status().available);

    mock->setFailing(false);
    mock->setAvailable(true);
    ASSERT_TRUE(waitFor([&] { return mock->getInitCalls() >= 2; }));
    ASSERT_TRUE(waitFor([&] { return mock->peek(DataKind::FLAGS, "flag-b").has_value(); }));
    EXPECT_TRUE(mock->peek(DataKind::FLAGS, "flag-a").has_value());
    EXPECT_EQ(persistentStore->getDataStoreStatusProvider()->status(), (DataStoreStatus{true, true}));

    persistentStore->close();
}

TEST_F(UpdateProcessorTest, DestructionWaitsForRunningStatusCallback) {
    auto mock = std::make_shared<MockPersistentStore>();
    auto persistentStore = Store::create(DataStoreConfig{}, mock);
    auto recovering = std::make_unique<UpdateProcessor>(persistentStore);
    recovering->applyBasis(Basis{fullTransfer({"flag-a"}, Selector("s", 1)), true, std::nullopt});
    ASSERT_EQ(mock->getInitCalls(), 1);

    std::atomic<bool> commitStarted{false};
    std::atomic<bool> commitFinished{false};
    mock->setInitHook([&] {
        commitStarted = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        commitFinished = true;
    });

    auto statusProvider = persistentStore->getDataStoreStatusProvider();
    std::thread notifier([&] { statusProvider->updateStatus(DataStoreStatus{true, true}); });
    bool started = waitFor([&] { return commitStarted.load(); });

    recovering.reset();
    bool finishedBeforeReturn = commitFinished.load();
    notifier.join();

    EXPECT_TRUE(started);
    EXPECT_TRUE(finishedBeforeReturn);

    // The listener is gone; later recoveries do not commit
    statusProvider->updateStatus(DataStoreStatus{false, true});
    statusProvider->updateStatus(DataStoreStatus{true, true});
    EXPECT_EQ(mock->getInitCalls(), 2);

    persistentStore->close();
}

} // namespace flagstore
