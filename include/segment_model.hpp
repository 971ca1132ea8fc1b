#pragma once

#include "clause.hpp"
#include "type_definitions.hpp"
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace flagstore {

struct SegmentTarget {
  std::string contextKind;
  StringSet values;
};

struct SegmentRule {
  std::string id;
  std::vector<Clause> clauses;
  std::optional<int64_t> weight;
  std::string bucketBy;
  std::string rolloutContextKind;
};

// Immutable segment record
class Segment {
public:
  // Throws ValidationException if data is not an object or is mistyped
  explicit Segment(nlohmann::json data);

  const std::string &getKey() const { return key_; }
  int64_t getVersion() const { return version_; }
  bool isDeleted() const { return deleted_; }
  const std::vector<std::string> &getIncluded() const { return included_; }
  const std::vector<std::string> &getExcluded() const { return excluded_; }
  const std::vector<SegmentTarget> &getIncludedContexts() const {
    return includedContexts_;
  }
  const std::vector<SegmentTarget> &getExcludedContexts() const {
    return excludedContexts_;
  }
  const std::vector<SegmentRule> &getRules() const { return rules_; }
  bool isUnbounded() const { return unbounded_; }
  const std::string &getUnboundedContextKind() const {
    return unboundedContextKind_;
  }
  std::optional<int64_t> getGeneration() const { return generation_; }
  const std::string &getSalt() const { return salt_; }

  const nlohmann::json &toJson() const { return data_; }

  bool operator==(const Segment &other) const { return data_ == other.data_; }
  bool operator!=(const Segment &other) const { return !(*this == other); }

private:
  nlohmann::json data_;
  std::string key_;
  int64_t version_ = 0;
  bool deleted_ = false;
  std::vector<std::string> included_;
  std::vector<std::string> excluded_;
  std::vector<SegmentTarget> includedContexts_;
  std::vector<SegmentTarget> excludedContexts_;
  std::vector<SegmentRule> rules_;
  bool unbounded_ = false;
  std::string unboundedContextKind_ = DEFAULT_CONTEXT_KIND;
  std::optional<int64_t> generation_;
  std::string salt_;

  static std::vector<SegmentTarget> parseTargets(const nlohmann::json &data);
};

using SegmentPtr = std::shared_ptr<const Segment>;

} // namespace flagstore
