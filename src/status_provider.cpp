#include "status_provider.hpp"

namespace flagstore {

DataStoreStatusProvider::DataStoreStatusProvider(std::shared_ptr<PersistentDataStore> store)
    : store_(std::move(store)), provider_(DataStoreStatus{true, false}, "DataStoreStatus") {
}

void DataStoreStatusProvider::updateStatus(const DataStoreStatus& status) {
    provider_.updateStatus(status);
}

bool DataStoreStatusProvider::monitoringEnabled() const {
    if (!store_) {
        return false;
    }
    const auto* probe = dynamic_cast<const StoreAvailabilityProbe*>(store_.get());
    return probe != nullptr && probe->monitoringEnabled();
}

DataSourceStatusProvider::DataSourceStatusProvider()
    : provider_(DataSourceStatus{}, "DataSourceStatus") {
}

void DataSourceStatusProvider::updateStatus(DataSourceState newState,
                                            const std::optional<DataSourceErrorInfo>& newError) {
    provider_.update([newState, &newError](const DataSourceStatus& old) -> std::optional<DataSourceStatus> {
        auto state = newState;
        if (state == DataSourceState::INTERRUPTED && old.state == DataSourceState::INITIALIZING) {
            state = DataSourceState::INITIALIZING;
        }
        if (state == DataSourceState::INITIALIZING) {
            state = old.state;
        }
        if (state == old.state && !newError) {
            return std::nullopt;
        }

        DataSourceStatus next;
        next.state = state;
        next.stateSince = state == old.state ? old.stateSince : std::chrono::system_clock::now();
        next.lastError = newError ? newError : old.lastError;
        return next;
    });
}

} // namespace flagstore
