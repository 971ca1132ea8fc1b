#include "store_item.hpp"
#include "exceptions.hpp"

namespace flagstore {

StoreItem::StoreItem(FeatureFlagPtr flag) : item_(std::move(flag)) {
    if (!std::get<FeatureFlagPtr>(item_)) {
        throw ValidationException(ErrorCode::INVALID_INPUT, "store item requires a flag");
    }
}

StoreItem::StoreItem(SegmentPtr segment) : item_(std::move(segment)) {
    if (!std::get<SegmentPtr>(item_)) {
        throw ValidationException(ErrorCode::INVALID_INPUT, "store item requires a segment");
    }
}

StoreItem StoreItem::decode(DataKind kind, const nlohmann::json& data) {
    switch (kind) {
    case DataKind::FLAGS:
        return StoreItem(std::make_shared<const FeatureFlag>(data));
    case DataKind::SEGMENTS:
        return StoreItem(std::make_shared<const Segment>(data));
    }
    throw ValidationException(ErrorCode::UNKNOWN_DATA_KIND, "unknown data kind");
}

nlohmann::json StoreItem::tombstone(const std::string& key, int64_t version) {
    return {{"key", key}, {"version", version}, {"deleted", true}};
}

DataKind StoreItem::getKind() const {
    return std::holds_alternative<FeatureFlagPtr>(item_) ? DataKind::FLAGS : DataKind::SEGMENTS;
}

const std::string& StoreItem::getKey() const {
    return std::visit([](const auto& ptr) -> const std::string& { return ptr->getKey(); }, item_);
}

int64_t StoreItem::getVersion() const {
    return std::visit([](const auto& ptr) { return ptr->getVersion(); }, item_);
}

bool StoreItem::isDeleted() const {
    return std::visit([](const auto& ptr) { return ptr->isDeleted(); }, item_);
}

const nlohmann::json& StoreItem::toJson() const {
    return std::visit([](const auto& ptr) -> const nlohmann::json& { return ptr->toJson(); }, item_);
}

FeatureFlagPtr StoreItem::asFlag() const {
    if (auto flag = std::get_if<FeatureFlagPtr>(&item_)) {
        return *flag;
    }
    return nullptr;
}

SegmentPtr StoreItem::asSegment() const {
    if (auto segment = std::get_if<SegmentPtr>(&item_)) {
        return *segment;
    }
    return nullptr;
}

bool StoreItem::operator==(const StoreItem& other) const {
    return getKind() == other.getKind() && toJson() == other.toJson();
}

} // namespace flagstore
