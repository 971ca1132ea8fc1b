#include "change_set.hpp"
#include "exceptions.hpp"
#include "json_fields.hpp"

namespace flagstore {

nlohmann::json Selector::toJson() const {
    return {{"state", state_}, {"version", version_}};
}

Selector Selector::fromJson(const nlohmann::json& data) {
    json_fields::requireObject(data, "selector");
    auto state = json_fields::optionalString(data, "state");
    auto version = json_fields::optionalInt(data, "version");
    if (!state || !version) {
        throw ValidationException(ErrorCode::MISSING_FIELD,
                                  "Missing required fields in Selector",
                                  !state ? "state" : "version");
    }
    return Selector(*state, *version);
}

const char* intentCodeToString(IntentCode code) {
    switch (code) {
    case IntentCode::TRANSFER_FULL:
        return "xfer-full";
    case IntentCode::TRANSFER_CHANGES:
        return "xfer-changes";
    case IntentCode::TRANSFER_NONE:
        return "none";
    }
    return "unknown";
}

std::optional<IntentCode> intentCodeFromString(std::string_view value) {
    for (auto code : {IntentCode::TRANSFER_FULL, IntentCode::TRANSFER_CHANGES, IntentCode::TRANSFER_NONE}) {
        if (value == intentCodeToString(code)) {
            return code;
        }
    }
    return std::nullopt;
}

const char* changeTypeToString(ChangeType type) {
    return type == ChangeType::PUT ? "put" : "delete";
}

ChangeSet ChangeSetBuilder::noChanges() {
    return ChangeSet{IntentCode::TRANSFER_NONE, {}, Selector::noSelector()};
}

ChangeSet ChangeSetBuilder::empty(const Selector& selector) {
    return ChangeSet{IntentCode::TRANSFER_FULL, {}, selector};
}

void ChangeSetBuilder::start(IntentCode intent) {
    intent_ = intent;
    changes_.clear();
}

void ChangeSetBuilder::expectChanges() {
    if (!intent_) {
        throw ValidationException(ErrorCode::MISSING_FIELD,
                                  "changeset: cannot expect changes without a server-intent",
                                  "intent");
    }
    if (*intent_ == IntentCode::TRANSFER_NONE) {
        intent_ = IntentCode::TRANSFER_CHANGES;
    }
}

void ChangeSetBuilder::reset() {
    changes_.clear();
}

ChangeSet ChangeSetBuilder::finish(const Selector& selector) {
    if (!intent_) {
        throw ValidationException(ErrorCode::MISSING_FIELD,
                                  "changeset: cannot complete without a server-intent",
                                  "intent");
    }
    ChangeSet changeSet{*intent_, std::move(changes_), selector};
    changes_.clear();
    if (*intent_ == IntentCode::TRANSFER_FULL) {
        intent_ = IntentCode::TRANSFER_CHANGES;
    }
    return changeSet;
}

void ChangeSetBuilder::addPut(DataKind kind, const std::string& key, int64_t version,
                              nlohmann::json object) {
    changes_.push_back(Change{ChangeType::PUT, kind, key, version, std::move(object)});
}

void ChangeSetBuilder::addDelete(DataKind kind, const std::string& key, int64_t version) {
    changes_.push_back(Change{ChangeType::DELETE, kind, key, version, nullptr});
}

} // namespace flagstore
