#include "data_set_sorter.hpp"

namespace flagstore {

SortedCollections DataSetSorter::sortAllCollections(const RawCollections& allData) {
    SortedCollections sorted;
    for (auto kind : ALL_DATA_KINDS) {
        auto it = allData.find(kind);
        if (it == allData.end()) {
            continue;
        }
        sorted.emplace_back(kind, sortCollection(kind, it->second));
    }
    return sorted;
}

SortedItems DataSetSorter::sortCollection(DataKind kind, const RawItemMap& items) {
    // Key order keeps the output stable for items without dependencies
    std::map<std::string, const nlohmann::json*> remaining;
    for (const auto& [key, item] : items) {
        remaining.emplace(key, &item);
    }

    SortedItems itemsOut;
    itemsOut.reserve(items.size());
    while (!remaining.empty()) {
        auto key = remaining.begin()->first;
        addWithDependenciesFirst(kind, key, remaining, itemsOut);
    }
    return itemsOut;
}

std::vector<std::string> DataSetSorter::dependencyKeys(DataKind kind, const nlohmann::json& item) {
    std::vector<std::string> keys;
    if (kind != DataKind::FLAGS || !item.is_object()) {
        return keys;
    }
    auto prereqs = item.find("prerequisites");
    if (prereqs == item.end() || !prereqs->is_array()) {
        return keys;
    }
    for (const auto& prereq : *prereqs) {
        if (!prereq.is_object()) {
            continue;
        }
        auto key = prereq.find("key");
        if (key != prereq.end() && key->is_string()) {
            keys.push_back(key->get<std::string>());
        }
    }
    return keys;
}

void DataSetSorter::addWithDependenciesFirst(DataKind kind, const std::string& key,
                                             std::map<std::string, const nlohmann::json*>& remaining,
                                             SortedItems& itemsOut) {
    auto it = remaining.find(key);
    if (it == remaining.end()) {
        return;
    }
    const nlohmann::json* item = it->second;
    remaining.erase(it);

    for (const auto& dependency : dependencyKeys(kind, *item)) {
        addWithDependenciesFirst(kind, dependency, remaining, itemsOut);
    }
    itemsOut.emplace_back(key, *item);
}

} // namespace flagstore
