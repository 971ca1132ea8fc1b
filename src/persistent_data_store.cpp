#include "persistent_data_store.hpp"
#include "store_item.hpp"

namespace flagstore {

bool PersistentDataStore::remove(DataKind kind, const std::string& key, int64_t version) {
    return upsert(kind, StoreItem::tombstone(key, version));
}

} // namespace flagstore
