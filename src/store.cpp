#include "store.hpp"
#include "logger.hpp"
#include "json_fields.hpp"

namespace flagstore {

const char* activeStoreModeToString(ActiveStoreMode mode) {
    switch (mode) {
        case ActiveStoreMode::MEMORY:
            return "memory";
        case ActiveStoreMode::PERSISTENT:
            return "persistent";
    }
    return "unknown";
}

Store::Store(std::shared_ptr<FlagChangeBroadcaster> flagChangeBroadcaster,
             std::shared_ptr<ChangeSetBroadcaster> changeSetBroadcaster,
             std::chrono::milliseconds lockTimeout)
    : lockTimeout_(lockTimeout),
      flagChangeBroadcaster_(flagChangeBroadcaster ? std::move(flagChangeBroadcaster)
                                                   : std::make_shared<FlagChangeBroadcaster>("FlagChange")),
      changeSetBroadcaster_(changeSetBroadcaster ? std::move(changeSetBroadcaster)
                                                 : std::make_shared<ChangeSetBroadcaster>("ChangeSet")),
      memoryStore_(std::make_shared<InMemoryStore>(lockTimeout)), selector_(Selector::noSelector()) {
}

Store::~Store() {
    close();
}

std::shared_ptr<Store> Store::create(const DataStoreConfig& config,
                                     std::shared_ptr<PersistentDataStore> persistentStore) {
    auto store = std::make_shared<Store>(nullptr, nullptr, config.lockTimeout);
    if (persistentStore) {
        auto statusProvider = std::make_shared<DataStoreStatusProvider>(persistentStore);
        auto wrapper = std::make_shared<PersistentStoreWrapper>(persistentStore, statusProvider, config.pollInterval);
        store->withPersistence(wrapper, config.writable(), statusProvider);
    }
    return store;
}

Store& Store::withPersistence(std::shared_ptr<PersistentStoreWrapper> wrapper, bool writable,
                              std::shared_ptr<DataStoreStatusProvider> statusProvider) {
    ScopedTimedLock<ContainerSharedMutex> lock(mutex_, lockTimeout_, "Store");
    persistentStore_ = std::move(wrapper);
    persistentStoreWritable_ = writable;
    statusProvider_ = std::move(statusProvider);
    if (persistentStore_) {
        activeMode_ = ActiveStoreMode::PERSISTENT;
    }
    STORE_LOG_INFO("Configured persistent store ({})", writable ? "read-write" : "read-only");
    return *this;
}

void Store::apply(const ChangeSet& changeSet, bool persist) {
    ApplyOutcome outcome;

    try {
        auto collections = changesToCollections(changeSet.changes);
        KindAndKeySet affected;

        {
            ScopedTimedLock<ContainerSharedMutex> lock(mutex_, lockTimeout_, "Store");
            switch (changeSet.intentCode) {
                case IntentCode::TRANSFER_FULL:
                    outcome.broadcastChangeSet = setBasis(collections, changeSet.selector, persist, affected);
                    break;
                case IntentCode::TRANSFER_CHANGES:
                    outcome.broadcastChangeSet = applyDelta(collections, changeSet.selector, persist, affected);
                    break;
                case IntentCode::TRANSFER_NONE:
                    outcome.broadcastChangeSet = true;
                    break;
            }
        }

        for (const auto& item : affected) {
            if (item.kind == DataKind::FLAGS) {
                outcome.changedFlagKeys.push_back(item.key);
            }
        }
    } catch (const FlagStoreException& e) {
        STORE_LOG_ERROR("Couldn't apply changeset: {}", e.toLogString());
        return;
    } catch (const std::exception& e) {
        STORE_LOG_ERROR("Couldn't apply changeset: {}", e.what());
        return;
    }

    for (const auto& key : outcome.changedFlagKeys) {
        flagChangeBroadcaster_->broadcast(key);
    }
    if (outcome.broadcastChangeSet) {
        changeSetBroadcaster_->broadcast(changeSet);
    }
}

bool Store::setBasis(const RawCollections& collections, const Selector& selector, bool persist,
                     KindAndKeySet& affectedOut) {
    std::optional<ItemCollections> oldData;
    // Tombstones take part in the diff so re-sending a delete is not a change
    if (flagChangeBroadcaster_->hasListeners()) {
        oldData = memoryStore_->snapshot();
    }

    if (!memoryStore_->setBasis(collections)) {
        return false;
    }

    resetDependencyTracker(collections);
    persist_ = persist;
    selector_ = selector;
    activeMode_ = ActiveStoreMode::MEMORY;

    if (shouldPersist()) {
        auto result = persistentStore_->init(collections);
        if (!result) {
            STORE_LOG_WARN("Failed to initialize persistent store: {}", result.errorMessage);
        }
    }

    if (oldData) {
        affectedOut = computeChangedItems(*oldData, collections);
    }
    return true;
}

bool Store::applyDelta(const RawCollections& collections, const Selector& selector, bool persist,
                       KindAndKeySet& affectedOut) {
    if (!memoryStore_->applyDelta(collections)) {
        return false;
    }

    bool hasListeners = flagChangeBroadcaster_->hasListeners();
    for (const auto& [kind, items] : collections) {
        for (const auto& [key, item] : items) {
            dependencyTracker_.updateDependenciesFrom(kind, key, item);
            if (hasListeners) {
                dependencyTracker_.addAffectedItems(affectedOut, KindAndKey{kind, key});
            }
        }
    }

    persist_ = persist;
    selector_ = selector;

    if (shouldPersist()) {
        for (const auto& [kind, items] : collections) {
            for (const auto& [key, item] : items) {
                auto result = persistentStore_->upsert(kind, item);
                if (!result) {
                    STORE_LOG_WARN("Failed to update {} \"{}\" in persistent store: {}", objectKindName(kind), key,
                                   result.errorMessage);
                }
            }
        }
    }
    return true;
}

StoreResult<void> Store::commit() {
    try {
        ScopedTimedLock<ContainerSharedMutex> lock(mutex_, lockTimeout_, "Store");
        if (!shouldPersist()) {
            return StoreResult<void>::ok();
        }

        RawCollections allData;
        for (auto kind : ALL_DATA_KINDS) {
            auto& out = allData[kind];
            for (const auto& [key, item] : memoryStore_->all(kind)) {
                out.emplace(key, item.toJson());
            }
        }

        auto result = persistentStore_->init(allData);
        if (result) {
            STORE_LOG_DEBUG("Committed in-memory data to persistent store");
        }
        return result;
    } catch (const LockTimeoutException&) {
        return StoreResult<void>::failure(std::current_exception());
    }
}

std::shared_ptr<const ReadOnlyStore> Store::getActiveStore() const {
    ScopedSharedLock<ContainerSharedMutex> lock(mutex_);
    if (activeMode_ == ActiveStoreMode::PERSISTENT && persistentStore_) {
        return persistentStore_;
    }
    return memoryStore_;
}

ActiveStoreMode Store::getActiveStoreMode() const {
    ScopedSharedLock<ContainerSharedMutex> lock(mutex_);
    return activeMode_;
}

bool Store::initialized() const {
    return getActiveStore()->initialized();
}

Selector Store::selector() const {
    ScopedSharedLock<ContainerSharedMutex> lock(mutex_);
    return selector_;
}

std::shared_ptr<DataStoreStatusProvider> Store::getDataStoreStatusProvider() const {
    ScopedSharedLock<ContainerSharedMutex> lock(mutex_);
    return statusProvider_;
}

void Store::close() {
    std::shared_ptr<PersistentStoreWrapper> wrapper;
    {
        ScopedSharedLock<ContainerSharedMutex> lock(mutex_);
        wrapper = persistentStore_;
    }
    // The poller may be calling back into the store; stop it without the lock
    if (wrapper) {
        wrapper->stop();
    }
}

bool Store::shouldPersist() const {
    return persist_ && persistentStore_ && persistentStoreWritable_;
}

RawCollections Store::changesToCollections(const std::vector<Change>& changes) {
    RawCollections collections;
    for (auto kind : ALL_DATA_KINDS) {
        collections[kind];
    }

    for (const auto& change : changes) {
        auto& items = collections[change.kind];
        if (change.action == ChangeType::PUT) {
            if (!change.object.is_null()) {
                items.insert_or_assign(change.key, change.object);
            }
        } else {
            items.insert_or_assign(change.key, StoreItem::tombstone(change.key, change.version));
        }
    }
    return collections;
}

void Store::resetDependencyTracker(const RawCollections& collections) {
    dependencyTracker_.reset();
    for (const auto& [kind, items] : collections) {
        for (const auto& [key, item] : items) {
            dependencyTracker_.updateDependenciesFrom(kind, key, item);
        }
    }
}

KindAndKeySet Store::computeChangedItems(const ItemCollections& oldData, const RawCollections& newData) const {
    KindAndKeySet affected;

    for (auto kind : ALL_DATA_KINDS) {
        static const ItemMap noItems;
        static const RawItemMap noRawItems;
        auto oldIt = oldData.find(kind);
        auto newIt = newData.find(kind);
        const auto& oldItems = oldIt == oldData.end() ? noItems : oldIt->second;
        const auto& newItems = newIt == newData.end() ? noRawItems : newIt->second;

        for (const auto& [key, oldItem] : oldItems) {
            auto match = newItems.find(key);
            if (match == newItems.end() ||
                json_fields::optionalInt(match->second, "version") != std::optional<int64_t>(oldItem.getVersion())) {
                dependencyTracker_.addAffectedItems(affected, KindAndKey{kind, key});
            }
        }
        for (const auto& [key, newItem] : newItems) {
            if (oldItems.find(key) == oldItems.end()) {
                dependencyTracker_.addAffectedItems(affected, KindAndKey{kind, key});
            }
        }
    }
    return affected;
}

} // namespace flagstore
