#pragma once

#include "clause.hpp"
#include "precomputed_results.hpp"
#include "type_definitions.hpp"
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace flagstore {

class FeatureFlag;

struct WeightedVariation {
  std::optional<int> variation;
  int64_t weight = 0;
  bool untracked = false;
};

struct Rollout {
  std::string contextKind;
  std::vector<WeightedVariation> variations;
  std::string bucketBy;
  std::string kind;
  std::optional<int64_t> seed;

  bool isExperiment() const { return kind == "experiment"; }
};

// Either a fixed variation or a percentage rollout
struct VariationOrRollout {
  std::optional<int> variation;
  std::optional<Rollout> rollout;
};

struct Prerequisite {
  std::string key;
  std::optional<int> variation;
};

struct Target {
  std::string contextKind;
  StringSet values;
  std::optional<int> variation;
};

struct FlagRule {
  std::string id;
  std::vector<Clause> clauses;
  VariationOrRollout variationOrRollout;
  bool trackEvents = false;
};

/**
 * Immutable feature flag record. Holds the raw payload it was built from,
 * the parsed fields, and the results precomputed from them.
 *
 * Variation indices that fall outside the variation list are logged as data
 * inconsistencies; construction still succeeds and the affected results carry
 * a MALFORMED_FLAG error.
 */
class FeatureFlag {
public:
  // Throws ValidationException if data is not an object or is mistyped
  explicit FeatureFlag(nlohmann::json data);

  const std::string &getKey() const { return key_; }
  int64_t getVersion() const { return version_; }
  bool isDeleted() const { return deleted_; }
  bool isOn() const { return on_; }
  const nlohmann::json &getVariations() const { return variations_; }
  std::optional<int> getOffVariation() const { return offVariation_; }
  const VariationOrRollout &getFallthrough() const { return fallthrough_; }
  const std::vector<Prerequisite> &getPrerequisites() const {
    return prerequisites_;
  }
  const std::vector<Target> &getTargets() const { return targets_; }
  const std::vector<Target> &getContextTargets() const {
    return contextTargets_;
  }
  const std::vector<FlagRule> &getRules() const { return rules_; }
  const std::string &getSalt() const { return salt_; }
  bool isClientSide() const { return clientSide_; }
  bool getTrackEvents() const { return trackEvents_; }
  bool getTrackEventsFallthrough() const { return trackEventsFallthrough_; }

  const FlagPrecomputedResults &getResults() const { return *results_; }

  // The raw payload; precomputed results are not part of it
  const nlohmann::json &toJson() const { return data_; }

  bool operator==(const FeatureFlag &other) const {
    return data_ == other.data_;
  }
  bool operator!=(const FeatureFlag &other) const { return !(*this == other); }

private:
  nlohmann::json data_;
  std::string key_;
  int64_t version_ = 0;
  bool deleted_ = false;
  bool on_ = false;
  nlohmann::json variations_ = nlohmann::json::array();
  std::optional<int> offVariation_;
  VariationOrRollout fallthrough_;
  std::vector<Prerequisite> prerequisites_;
  std::vector<Target> targets_;
  std::vector<Target> contextTargets_;
  std::vector<FlagRule> rules_;
  std::string salt_;
  bool clientSide_ = false;
  bool trackEvents_ = false;
  bool trackEventsFallthrough_ = false;
  std::shared_ptr<const FlagPrecomputedResults> results_;

  void checkVariationRange(std::optional<int> variation,
                           const std::string &description,
                           std::vector<std::string> &errorsOut) const;
  VariationOrRollout parseVariationOrRollout(
      std::optional<int> variation, const nlohmann::json &rolloutData,
      const std::string &description, std::vector<std::string> &errorsOut);
  std::vector<Target> parseTargets(const nlohmann::json &targetsData,
                                   std::vector<std::string> &errorsOut);
  FlagPrecomputedResults precomputeResults() const;
};

using FeatureFlagPtr = std::shared_ptr<const FeatureFlag>;

} // namespace flagstore
