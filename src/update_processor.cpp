#include "update_processor.hpp"
#include "logger.hpp"

namespace flagstore {

UpdateProcessor::UpdateProcessor(std::shared_ptr<Store> store, std::shared_ptr<DataSourceStatusProvider> sourceStatus)
    : store_(std::move(store)),
      sourceStatus_(sourceStatus ? std::move(sourceStatus) : std::make_shared<DataSourceStatusProvider>()) {
    if (!store_) {
        throw SystemException(ErrorCode::CONFIGURATION_ERROR, "Update processor requires a store", "UpdateProcessor");
    }

    storeStatus_ = store_->getDataStoreStatusProvider();
    if (storeStatus_) {
        listenerGuard_ = std::make_shared<ListenerGuard>();
        storeStatusListener_ = storeStatus_->addListener(
            [this, guard = listenerGuard_](const DataStoreStatus& status) {
                std::lock_guard<std::mutex> lock(guard->mutex);
                if (guard->active) {
                    onDataStoreStatus(status);
                }
            });
    }
}

UpdateProcessor::~UpdateProcessor() {
    stop();
    if (listenerGuard_) {
        // Waits for a status callback running on the poller thread
        std::lock_guard<std::mutex> lock(listenerGuard_->mutex);
        listenerGuard_->active = false;
    }
    if (storeStatus_ && storeStatusListener_) {
        storeStatus_->removeListener(*storeStatusListener_);
    }
}

bool UpdateProcessor::applyBasis(const Basis& basis) {
    store_->apply(basis.changeSet, basis.persist);
    if (basis.environmentId) {
        std::lock_guard<std::mutex> lock(mutex_);
        environmentId_ = basis.environmentId;
    }

    bool hasSelector = basis.changeSet.selector.isDefined();
    if (hasSelector) {
        ready_ = true;
    }
    return hasSelector;
}

bool UpdateProcessor::runInitializers(const std::vector<std::shared_ptr<Initializer>>& initializers) {
    sourceStatus_->updateStatus(DataSourceState::INITIALIZING);

    for (const auto& initializer : initializers) {
        if (stopped_) {
            return false;
        }
        if (!initializer) {
            continue;
        }

        SOURCE_LOG_INFO("Attempting to initialize via {}", initializer->name());
        try {
            auto result = initializer->fetch(*store_);
            if (!result.isSuccess()) {
                SOURCE_LOG_WARN("Initializer {} failed: {}", initializer->name(), result.errorMessage);
                continue;
            }

            SOURCE_LOG_INFO("Initialized via {}", initializer->name());
            if (applyBasis(*result.basis)) {
                return true;
            }
        } catch (const FlagStoreException& e) {
            SOURCE_LOG_ERROR("Initializer {} failed with exception: {}", initializer->name(), e.toLogString());
        } catch (const std::exception& e) {
            SOURCE_LOG_ERROR("Initializer {} failed with exception: {}", initializer->name(), e.what());
        }
    }
    return false;
}

bool UpdateProcessor::handleUpdate(const Update& update) {
    if (stopped_) {
        return false;
    }

    if (update.changeSet) {
        store_->apply(*update.changeSet, true);
    }
    if (update.environmentId) {
        std::lock_guard<std::mutex> lock(mutex_);
        environmentId_ = update.environmentId;
    }
    if (update.state == DataSourceState::VALID) {
        ready_ = true;
    }

    sourceStatus_->updateStatus(update.state, update.error);

    if (update.fallbackRequested) {
        SOURCE_LOG_WARN("Update source requested fallback to the previous protocol; stopping synchronizer");
        return false;
    }
    return update.state != DataSourceState::OFF;
}

void UpdateProcessor::runSynchronizer(Synchronizer& synchronizer) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        activeSynchronizer_ = &synchronizer;
    }

    SOURCE_LOG_INFO("Starting synchronizer {}", synchronizer.name());
    try {
        synchronizer.sync(*store_, [this](const Update& update) { return handleUpdate(update); });
    } catch (const std::exception& e) {
        SOURCE_LOG_ERROR("Error consuming synchronizer results: {}", e.what());
        DataSourceErrorInfo error;
        error.kind = DataSourceErrorInfo::Kind::UNKNOWN;
        error.message = e.what();
        sourceStatus_->updateStatus(DataSourceState::INTERRUPTED, error);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    activeSynchronizer_ = nullptr;
}

void UpdateProcessor::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_.exchange(true)) {
        return;
    }
    if (activeSynchronizer_) {
        activeSynchronizer_->stop();
    }
}

std::optional<std::string> UpdateProcessor::getEnvironmentId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return environmentId_;
}

void UpdateProcessor::onDataStoreStatus(const DataStoreStatus& status) {
    if (!status.available || !status.stale) {
        return;
    }

    auto result = store_->commit();
    if (!result) {
        SOURCE_LOG_ERROR("Failed to reinitialize data store: {}", result.errorMessage);
    }
}

} // namespace flagstore
