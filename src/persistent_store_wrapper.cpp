#include "persistent_store_wrapper.hpp"
#include "data_set_sorter.hpp"
#include "logger.hpp"
#include <boost/asio/post.hpp>
#include <type_traits>

namespace flagstore {

namespace {

constexpr std::chrono::milliseconds STATE_LOCK_TIMEOUT{5000};

} // namespace

PersistentStoreWrapper::PersistentStoreWrapper(std::shared_ptr<PersistentDataStore> store,
                                               std::shared_ptr<DataStoreUpdateSink> statusSink,
                                               std::chrono::milliseconds pollInterval)
    : store_(std::move(store)), probe_(dynamic_cast<StoreAvailabilityProbe*>(store_.get())),
      statusSink_(std::move(statusSink)), pollInterval_(pollInterval),
      workGuard_(net::make_work_guard(ioc_)), pollTimer_(ioc_) {
    if (!store_) {
        throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                              "Persistent store wrapper requires a store", "PersistentStoreWrapper");
    }

    worker_ = std::thread([this]() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            PERSIST_LOG_ERROR("Availability poller thread exception: {}", e.what());
        }
    });
}

PersistentStoreWrapper::~PersistentStoreWrapper() {
    stop();
}

template <typename T, typename Operation>
StoreResult<T> PersistentStoreWrapper::invoke(const char* operation, Operation&& fn) const {
    try {
        if constexpr (std::is_void_v<T>) {
            fn();
            return StoreResult<void>::ok();
        } else {
            return StoreResult<T>::ok(fn());
        }
    } catch (const std::exception&) {
        auto error = std::current_exception();
        handleFailure(operation, error);
        return StoreResult<T>::failure(error);
    }
}

StoreResult<void> PersistentStoreWrapper::init(const RawCollections& allData) {
    auto sorted = DataSetSorter::sortAllCollections(allData);
    return invoke<void>("init", [this, &sorted]() { store_->init(sorted); });
}

StoreResult<std::optional<StoreItem>> PersistentStoreWrapper::tryGet(DataKind kind, const std::string& key) const {
    auto raw = invoke<std::optional<nlohmann::json>>("get", [this, kind, &key]() { return store_->get(kind, key); });
    if (!raw) {
        return StoreResult<std::optional<StoreItem>>::failure(raw.error);
    }
    if (!raw.value->has_value()) {
        return StoreResult<std::optional<StoreItem>>::ok(std::nullopt);
    }

    // A payload that does not decode is a data problem, not an outage
    try {
        return StoreResult<std::optional<StoreItem>>::ok(StoreItem::decode(kind, **raw.value));
    } catch (const std::exception&) {
        auto error = std::current_exception();
        PERSIST_LOG_ERROR("Failed decoding {} \"{}\" from persistent store: {}", objectKindName(kind), key,
                          describeException(error));
        return StoreResult<std::optional<StoreItem>>::failure(error);
    }
}

StoreResult<ItemMap> PersistentStoreWrapper::tryAll(DataKind kind) const {
    auto raw = invoke<RawItemMap>("all", [this, kind]() { return store_->all(kind); });
    if (!raw) {
        return StoreResult<ItemMap>::failure(raw.error);
    }

    try {
        ItemMap items;
        for (const auto& [key, data] : *raw.value) {
            items.insert_or_assign(key, StoreItem::decode(kind, data));
        }
        return StoreResult<ItemMap>::ok(std::move(items));
    } catch (const std::exception&) {
        auto error = std::current_exception();
        PERSIST_LOG_ERROR("Failed decoding {} collection from persistent store: {}", namespaceName(kind),
                          describeException(error));
        return StoreResult<ItemMap>::failure(error);
    }
}

StoreResult<bool> PersistentStoreWrapper::upsert(DataKind kind, const nlohmann::json& item) {
    return invoke<bool>("upsert", [this, kind, &item]() { return store_->upsert(kind, item); });
}

StoreResult<bool> PersistentStoreWrapper::remove(DataKind kind, const std::string& key, int64_t version) {
    return invoke<bool>("remove", [this, kind, &key, version]() { return store_->remove(kind, key, version); });
}

std::optional<StoreItem> PersistentStoreWrapper::get(DataKind kind, const std::string& key) const {
    auto result = tryGet(kind, key);
    if (!result || !result.value->has_value() || (*result.value)->isDeleted()) {
        return std::nullopt;
    }
    return *result.value;
}

ItemMap PersistentStoreWrapper::all(DataKind kind) const {
    auto result = tryAll(kind);
    ItemMap items;
    if (!result) {
        return items;
    }
    for (const auto& [key, item] : *result.value) {
        if (!item.isDeleted()) {
            items.emplace(key, item);
        }
    }
    return items;
}

bool PersistentStoreWrapper::initialized() const {
    try {
        return store_->initialized();
    } catch (const std::exception& e) {
        PERSIST_LOG_DEBUG("Persistent store initialized check failed: {}", e.what());
        return false;
    }
}

bool PersistentStoreWrapper::monitoringEnabled() const {
    return probe_ != nullptr && probe_->monitoringEnabled();
}

bool PersistentStoreWrapper::isAvailable() const {
    ScopedTimedLock<StateMutex> lock(stateMutex_, STATE_LOCK_TIMEOUT, "PersistentStoreWrapper");
    return lastAvailable_;
}

bool PersistentStoreWrapper::isPolling() const {
    ScopedTimedLock<StateMutex> lock(stateMutex_, STATE_LOCK_TIMEOUT, "PersistentStoreWrapper");
    return polling_;
}

void PersistentStoreWrapper::handleFailure(const char* operation, const std::exception_ptr& error) const {
    PERSIST_LOG_ERROR("Persistent store {} failed: {}", operation, describeException(error));
    if (monitoringEnabled()) {
        updateAvailability(false);
    }
}

void PersistentStoreWrapper::updateAvailability(bool available) const {
    bool startPoller = false;
    bool cancelPoller = false;
    uint64_t generation = 0;
    {
        ScopedTimedLock<StateMutex> lock(stateMutex_, STATE_LOCK_TIMEOUT, "PersistentStoreWrapper");
        if (available == lastAvailable_) {
            return;
        }
        lastAvailable_ = available;

        if (!available && !polling_ && !stopped_) {
            polling_ = true;
            generation = ++generation_;
            startPoller = true;
        } else if (available && polling_) {
            polling_ = false;
            ++generation_;
            cancelPoller = true;
        }
    }

    if (available) {
        PERSIST_LOG_WARN("Persistent store is available again");
    } else {
        PERSIST_LOG_WARN("Detected persistent store unavailability; updates will be cached until it recovers");
    }

    if (statusSink_) {
        statusSink_->updateStatus(DataStoreStatus{available, true});
    }

    if (startPoller) {
        net::post(ioc_, [this, generation]() { schedulePoll(generation); });
    } else if (cancelPoller) {
        net::post(ioc_, [this]() { pollTimer_.cancel(); });
    }
}

void PersistentStoreWrapper::schedulePoll(uint64_t generation) const {
    if (generation != generation_.load()) {
        return;
    }

    pollTimer_.expires_after(pollInterval_);
    pollTimer_.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        if (ec) {
            PERSIST_LOG_ERROR("Availability poll timer error: {}", ec.message());
            return;
        }
        poll(generation);
    });
}

void PersistentStoreWrapper::poll(uint64_t generation) const {
    if (generation != generation_.load()) {
        return;
    }

    bool available = false;
    try {
        available = probe_ != nullptr && probe_->isAvailable();
    } catch (const std::exception& e) {
        PERSIST_LOG_ERROR("Unexpected error from data store status function: {}", e.what());
    }

    if (available) {
        updateAvailability(true);
    } else {
        schedulePoll(generation);
    }
}

void PersistentStoreWrapper::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    {
        ScopedTimedLock<StateMutex> lock(stateMutex_, STATE_LOCK_TIMEOUT, "PersistentStoreWrapper");
        polling_ = false;
        ++generation_;
    }

    try {
        store_->stop();
    } catch (const std::exception& e) {
        PERSIST_LOG_ERROR("Error stopping persistent store: {}", e.what());
    }

    net::post(ioc_, [this]() { pollTimer_.cancel(); });
    workGuard_.reset();
    ioc_.stop();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
    PERSIST_LOG_DEBUG("Persistent store wrapper stopped");
}

} // namespace flagstore
