#include "flag_model.hpp"
#include "json_fields.hpp"
#include "logger.hpp"

namespace flagstore {

using namespace json_fields;

FeatureFlag::FeatureFlag(nlohmann::json data) : data_(std::move(data)) {
    requireObject(data_, "feature flag");

    key_ = stringOr(data_, "key");
    version_ = intOr(data_, "version");
    deleted_ = boolOr(data_, "deleted");
    if (deleted_) {
        results_ = std::make_shared<const FlagPrecomputedResults>();
        return;
    }

    std::vector<std::string> errors;

    variations_ = arrayOr(data_, "variations");
    on_ = boolOr(data_, "on");
    salt_ = stringOr(data_, "salt");
    clientSide_ = boolOr(data_, "clientSide");
    trackEvents_ = boolOr(data_, "trackEvents");
    trackEventsFallthrough_ = boolOr(data_, "trackEventsFallthrough");

    const auto& fallthrough = objectOr(data_, "fallthrough");
    fallthrough_ = parseVariationOrRollout(optionalIndex(fallthrough, "variation"),
                                           field(fallthrough, "rollout"), "fallthrough", errors);

    offVariation_ = optionalIndex(data_, "offVariation");
    checkVariationRange(offVariation_, "off variation", errors);

    for (const auto& prereqData : arrayOr(data_, "prerequisites")) {
        requireObject(prereqData, "prerequisite");
        Prerequisite prereq{stringOr(prereqData, "key"), optionalIndex(prereqData, "variation")};
        checkVariationRange(prereq.variation, "prerequisite", errors);
        prerequisites_.push_back(std::move(prereq));
    }

    targets_ = parseTargets(arrayOr(data_, "targets"), errors);
    contextTargets_ = parseTargets(arrayOr(data_, "contextTargets"), errors);

    for (const auto& ruleData : arrayOr(data_, "rules")) {
        requireObject(ruleData, "rule");
        FlagRule rule;
        rule.id = stringOr(ruleData, "id");
        rule.trackEvents = boolOr(ruleData, "trackEvents");
        for (const auto& clauseData : arrayOr(ruleData, "clauses")) {
            requireObject(clauseData, "clause");
            rule.clauses.emplace_back(clauseData, errors);
        }
        rule.variationOrRollout = parseVariationOrRollout(optionalIndex(ruleData, "variation"),
                                                          field(ruleData, "rollout"), "rule", errors);
        rules_.push_back(std::move(rule));
    }

    results_ = std::make_shared<const FlagPrecomputedResults>(precomputeResults());

    for (const auto& message : errors) {
        MODEL_LOG_WARN("Data inconsistency in feature flag \"{}\": {}", key_, message);
    }
}

void FeatureFlag::checkVariationRange(std::optional<int> variation,
                                      const std::string& description,
                                      std::vector<std::string>& errorsOut) const {
    if (!variation) {
        return;
    }
    if (*variation < 0 || static_cast<std::size_t>(*variation) >= variations_.size()) {
        errorsOut.push_back(description + " has invalid variation index");
    }
}

VariationOrRollout FeatureFlag::parseVariationOrRollout(std::optional<int> variation,
                                                        const nlohmann::json& rolloutData,
                                                        const std::string& description,
                                                        std::vector<std::string>& errorsOut) {
    VariationOrRollout result;
    result.variation = variation;
    checkVariationRange(variation, description, errorsOut);

    if (rolloutData.is_null()) {
        return result;
    }
    requireObject(rolloutData, "rollout");

    Rollout rollout;
    rollout.contextKind = stringOr(rolloutData, "contextKind");
    rollout.bucketBy = stringOr(rolloutData, "bucketBy");
    rollout.kind = stringOr(rolloutData, "kind");
    rollout.seed = optionalInt(rolloutData, "seed");
    for (const auto& weighted : arrayOr(rolloutData, "variations")) {
        requireObject(weighted, "weighted variation");
        WeightedVariation wv;
        wv.variation = optionalIndex(weighted, "variation");
        wv.weight = intOr(weighted, "weight");
        wv.untracked = boolOr(weighted, "untracked");
        checkVariationRange(wv.variation, description, errorsOut);
        rollout.variations.push_back(wv);
    }
    result.rollout = std::move(rollout);
    return result;
}

std::vector<Target> FeatureFlag::parseTargets(const nlohmann::json& targetsData,
                                              std::vector<std::string>& errorsOut) {
    std::vector<Target> targets;
    for (const auto& targetData : targetsData) {
        requireObject(targetData, "target");
        Target target;
        target.contextKind = stringOr(targetData, "contextKind", DEFAULT_CONTEXT_KIND);
        for (auto& value : stringList(targetData, "values")) {
            target.values.insert(std::move(value));
        }
        target.variation = optionalIndex(targetData, "variation");
        checkVariationRange(target.variation, "target", errorsOut);
        targets.push_back(std::move(target));
    }
    return targets;
}

FlagPrecomputedResults FeatureFlag::precomputeResults() const {
    FlagPrecomputedResults results;

    results.offResult = precompute::detailForOffVariation(variations_, offVariation_,
                                                         EvaluationReason::off());
    results.fallthroughResults = precompute::multiVariationResults(
        variations_, EvaluationReason::fallthrough(false), EvaluationReason::fallthrough(true));

    for (std::size_t i = 0; i < rules_.size(); ++i) {
        const auto index = static_cast<int>(i);
        results.ruleMatchResults.push_back(precompute::multiVariationResults(
            variations_, EvaluationReason::ruleMatch(index, rules_[i].id, false),
            EvaluationReason::ruleMatch(index, rules_[i].id, true)));
    }

    for (const auto& prereq : prerequisites_) {
        results.prerequisiteFailureResults.push_back(precompute::detailForOffVariation(
            variations_, offVariation_, EvaluationReason::prerequisiteFailed(prereq.key)));
    }

    for (const auto& target : targets_) {
        results.targetMatchResults.push_back(precompute::detailForVariation(
            variations_, target.variation, EvaluationReason::targetMatch()));
    }
    for (const auto& target : contextTargets_) {
        results.contextTargetMatchResults.push_back(precompute::detailForVariation(
            variations_, target.variation, EvaluationReason::targetMatch()));
    }

    return results;
}

} // namespace flagstore
