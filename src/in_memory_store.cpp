#include "in_memory_store.hpp"
#include "logger.hpp"

namespace flagstore {

InMemoryStore::InMemoryStore(std::chrono::milliseconds lockTimeout)
    : lockTimeout_(lockTimeout) {
}

std::optional<StoreItem> InMemoryStore::get(DataKind kind, const std::string& key) const {
    ScopedSharedLock<ResourceSharedMutex> lock(mutex_);

    auto kindIt = items_.find(kind);
    if (kindIt == items_.end()) {
        return std::nullopt;
    }
    auto it = kindIt->second.find(key);
    if (it == kindIt->second.end() || it->second.isDeleted()) {
        return std::nullopt;
    }
    return it->second;
}

ItemMap InMemoryStore::all(DataKind kind) const {
    ScopedSharedLock<ResourceSharedMutex> lock(mutex_);

    ItemMap result;
    auto kindIt = items_.find(kind);
    if (kindIt == items_.end()) {
        return result;
    }
    for (const auto& [key, item] : kindIt->second) {
        if (!item.isDeleted()) {
            result.emplace(key, item);
        }
    }
    return result;
}

ItemCollections InMemoryStore::snapshot() const {
    ScopedSharedLock<ResourceSharedMutex> lock(mutex_);
    return items_;
}

bool InMemoryStore::setBasis(const RawCollections& collections) {
    auto decoded = decodeCollections(collections);
    if (!decoded) {
        MEMSTORE_LOG_ERROR("Failed applying set_basis: collection could not be decoded");
        return false;
    }

    {
        ScopedTimedLock<ResourceSharedMutex> lock(mutex_, lockTimeout_, "InMemoryStore");
        items_ = std::move(*decoded);
        initialized_ = true;
    }
    MEMSTORE_LOG_DEBUG("Replaced store contents with {} flags and {} segments",
                       collections.count(DataKind::FLAGS) ? collections.at(DataKind::FLAGS).size() : 0,
                       collections.count(DataKind::SEGMENTS) ? collections.at(DataKind::SEGMENTS).size() : 0);
    return true;
}

bool InMemoryStore::applyDelta(const RawCollections& collections) {
    auto decoded = decodeCollections(collections);
    if (!decoded) {
        MEMSTORE_LOG_ERROR("Failed applying apply_delta: collection could not be decoded");
        return false;
    }

    ScopedTimedLock<ResourceSharedMutex> lock(mutex_, lockTimeout_, "InMemoryStore");
    for (auto& [kind, kindItems] : *decoded) {
        auto& existing = items_[kind];
        for (auto& [key, item] : kindItems) {
            existing.insert_or_assign(key, std::move(item));
        }
    }
    return true;
}

std::optional<ItemCollections> InMemoryStore::decodeCollections(const RawCollections& collections) {
    ItemCollections decoded;
    try {
        for (const auto& [kind, kindItems] : collections) {
            auto& out = decoded[kind];
            for (const auto& [key, item] : kindItems) {
                out.insert_or_assign(key, StoreItem::decode(kind, item));
            }
        }
    } catch (const FlagStoreException& e) {
        MEMSTORE_LOG_ERROR("Failed decoding collection: {}", e.toLogString());
        return std::nullopt;
    } catch (const nlohmann::json::exception& e) {
        MEMSTORE_LOG_ERROR("Failed decoding collection: {}", e.what());
        return std::nullopt;
    }
    return decoded;
}

} // namespace flagstore
