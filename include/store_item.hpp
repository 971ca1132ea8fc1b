#pragma once

#include "data_kind.hpp"
#include "flag_model.hpp"
#include "segment_model.hpp"
#include "type_definitions.hpp"
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace flagstore {

/**
 * A decoded flag or segment. Cheap to copy: both alternatives are shared
 * pointers to immutable records.
 */
class StoreItem {
public:
  StoreItem(FeatureFlagPtr flag);
  StoreItem(SegmentPtr segment);

  // Decodes a raw payload of the given kind; throws ValidationException
  static StoreItem decode(DataKind kind, const nlohmann::json &data);

  // {key, version, deleted: true}
  static nlohmann::json tombstone(const std::string &key, int64_t version);

  DataKind getKind() const;
  const std::string &getKey() const;
  int64_t getVersion() const;
  bool isDeleted() const;
  const nlohmann::json &toJson() const;

  FeatureFlagPtr asFlag() const;
  SegmentPtr asSegment() const;

  bool operator==(const StoreItem &other) const;
  bool operator!=(const StoreItem &other) const { return !(*this == other); }

private:
  std::variant<FeatureFlagPtr, SegmentPtr> item_;
};

using ItemMap = StringKeyedMap<StoreItem>;
using ItemCollections = std::map<DataKind, ItemMap>;

} // namespace flagstore
