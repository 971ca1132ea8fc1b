#include "dependency_tracker.hpp"
#include "clause.hpp"

namespace flagstore {

namespace {

const nlohmann::json* arrayField(const nlohmann::json& object, const char* name) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(name);
    return it != object.end() && it->is_array() ? &*it : nullptr;
}

void addSegmentKeysFromRules(const nlohmann::json& item, KindAndKeySet& out) {
    const auto* rules = arrayField(item, "rules");
    if (!rules) {
        return;
    }
    for (const auto& rule : *rules) {
        const auto* clauses = arrayField(rule, "clauses");
        if (!clauses) {
            continue;
        }
        for (const auto& clause : *clauses) {
            auto op = clause.find("op");
            if (op == clause.end() || *op != SEGMENT_MATCH_OPERATOR) {
                continue;
            }
            const auto* values = arrayField(clause, "values");
            if (!values) {
                continue;
            }
            for (const auto& value : *values) {
                if (value.is_string()) {
                    out.insert({DataKind::SEGMENTS, value.get<std::string>()});
                }
            }
        }
    }
}

} // namespace

KindAndKeySet DependencyTracker::computeDependenciesFrom(DataKind kind, const nlohmann::json& item) {
    KindAndKeySet result;
    if (!item.is_object()) {
        return result;
    }
    if (auto deleted = item.find("deleted"); deleted != item.end() && *deleted == true) {
        return result;
    }

    if (kind == DataKind::FLAGS) {
        if (const auto* prereqs = arrayField(item, "prerequisites")) {
            for (const auto& prereq : *prereqs) {
                if (!prereq.is_object()) {
                    continue;
                }
                auto key = prereq.find("key");
                if (key != prereq.end() && key->is_string()) {
                    result.insert({DataKind::FLAGS, key->get<std::string>()});
                }
            }
        }
    }
    addSegmentKeysFromRules(item, result);
    return result;
}

void DependencyTracker::updateDependenciesFrom(DataKind kind, const std::string& key,
                                               const nlohmann::json& item) {
    KindAndKey fromWhat{kind, key};
    auto updated = computeDependenciesFrom(kind, item);

    if (auto old = from_.find(fromWhat); old != from_.end()) {
        for (const auto& oldDependency : old->second) {
            if (auto dependents = to_.find(oldDependency); dependents != to_.end()) {
                dependents->second.erase(fromWhat);
            }
        }
    }

    for (const auto& dependency : updated) {
        to_[dependency].insert(fromWhat);
    }
    from_[fromWhat] = std::move(updated);
}

void DependencyTracker::addAffectedItems(KindAndKeySet& itemsOut,
                                         const KindAndKey& initialModifiedItem) const {
    if (!itemsOut.insert(initialModifiedItem).second) {
        return;
    }
    auto dependents = to_.find(initialModifiedItem);
    if (dependents == to_.end()) {
        return;
    }
    for (const auto& affected : dependents->second) {
        addAffectedItems(itemsOut, affected);
    }
}

void DependencyTracker::reset() {
    from_.clear();
    to_.clear();
}

} // namespace flagstore
