#include "precomputed_results.hpp"

namespace flagstore {

EvalResultsForSingleVariation::EvalResultsForSingleVariation(
    const nlohmann::json& value, int variationIndex,
    const EvaluationReason& regularReason,
    const std::optional<EvaluationReason>& inExperimentReason)
    : regularResult_(value, variationIndex, regularReason),
      inExperimentResult_(value, variationIndex,
                          inExperimentReason ? *inExperimentReason : regularReason) {
}

EvaluationDetail EvalResultFactoryMultiVariations::forVariation(int index, bool inExperiment) const {
    if (index < 0 || static_cast<std::size_t>(index) >= factories_.size()) {
        return precompute::malformedFlagDetail();
    }
    return factories_[static_cast<std::size_t>(index)].getResult(inExperiment);
}

namespace precompute {

EvaluationDetail malformedFlagDetail() {
    return EvaluationDetail(nullptr, std::nullopt,
                            EvaluationReason::error(EvaluationReason::ErrorKind::MALFORMED_FLAG));
}

EvaluationDetail detailForVariation(const nlohmann::json& variations,
                                    std::optional<int> index,
                                    const EvaluationReason& reason) {
    if (!index || *index < 0 || static_cast<std::size_t>(*index) >= variations.size()) {
        return malformedFlagDetail();
    }
    return EvaluationDetail(variations[static_cast<std::size_t>(*index)], index, reason);
}

EvaluationDetail detailForOffVariation(const nlohmann::json& variations,
                                       std::optional<int> offVariation,
                                       const EvaluationReason& reason) {
    if (!offVariation) {
        return EvaluationDetail(nullptr, std::nullopt, reason);
    }
    return detailForVariation(variations, offVariation, reason);
}

EvalResultFactoryMultiVariations multiVariationResults(const nlohmann::json& variations,
                                                       const EvaluationReason& regularReason,
                                                       const EvaluationReason& inExperimentReason) {
    std::vector<EvalResultsForSingleVariation> factories;
    factories.reserve(variations.size());
    for (std::size_t i = 0; i < variations.size(); ++i) {
        factories.emplace_back(variations[i], static_cast<int>(i), regularReason, inExperimentReason);
    }
    return EvalResultFactoryMultiVariations(std::move(factories));
}

} // namespace precompute

} // namespace flagstore
