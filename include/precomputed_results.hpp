#pragma once

#include "evaluation_detail.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace flagstore {

// Regular and in-experiment results for one variation
class EvalResultsForSingleVariation {
public:
  EvalResultsForSingleVariation(
      const nlohmann::json &value, int variationIndex,
      const EvaluationReason &regularReason,
      const std::optional<EvaluationReason> &inExperimentReason = std::nullopt);

  const EvaluationDetail &getResult(bool inExperiment = false) const {
    return inExperiment ? inExperimentResult_ : regularResult_;
  }

  bool operator==(const EvalResultsForSingleVariation &other) const {
    return regularResult_ == other.regularResult_ &&
           inExperimentResult_ == other.inExperimentResult_;
  }

private:
  EvaluationDetail regularResult_;
  EvaluationDetail inExperimentResult_;
};

// Results for every variation of a flag under one pair of reasons
class EvalResultFactoryMultiVariations {
public:
  EvalResultFactoryMultiVariations() = default;
  explicit EvalResultFactoryMultiVariations(
      std::vector<EvalResultsForSingleVariation> factories)
      : factories_(std::move(factories)) {}

  // An index outside the variations yields a MALFORMED_FLAG error detail
  EvaluationDetail forVariation(int index, bool inExperiment) const;

  std::size_t size() const { return factories_.size(); }

  bool operator==(const EvalResultFactoryMultiVariations &other) const {
    return factories_ == other.factories_;
  }

private:
  std::vector<EvalResultsForSingleVariation> factories_;
};

namespace precompute {

EvaluationDetail malformedFlagDetail();

EvaluationDetail detailForVariation(const nlohmann::json &variations,
                                    std::optional<int> index,
                                    const EvaluationReason &reason);

// No off variation gives a null value with no index
EvaluationDetail detailForOffVariation(const nlohmann::json &variations,
                                       std::optional<int> offVariation,
                                       const EvaluationReason &reason);

EvalResultFactoryMultiVariations
multiVariationResults(const nlohmann::json &variations,
                      const EvaluationReason &regularReason,
                      const EvaluationReason &inExperimentReason);

} // namespace precompute

/**
 * Evaluation results derived from a flag at construction time. Built once per
 * flag version, never mutated, and never part of the flag's serialized form.
 */
struct FlagPrecomputedResults {
  EvaluationDetail offResult{nullptr, std::nullopt, EvaluationReason::off()};
  EvalResultFactoryMultiVariations fallthroughResults;
  std::vector<EvalResultFactoryMultiVariations> ruleMatchResults;
  std::vector<EvaluationDetail> prerequisiteFailureResults;
  std::vector<EvaluationDetail> targetMatchResults;
  std::vector<EvaluationDetail> contextTargetMatchResults;

  bool operator==(const FlagPrecomputedResults &other) const {
    return offResult == other.offResult &&
           fallthroughResults == other.fallthroughResults &&
           ruleMatchResults == other.ruleMatchResults &&
           prerequisiteFailureResults == other.prerequisiteFailureResults &&
           targetMatchResults == other.targetMatchResults &&
           contextTargetMatchResults == other.contextTargetMatchResults;
  }
};

} // namespace flagstore
