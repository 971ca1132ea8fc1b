#include "segment_model.hpp"
#include "json_fields.hpp"
#include "logger.hpp"

namespace flagstore {

using namespace json_fields;

Segment::Segment(nlohmann::json data) : data_(std::move(data)) {
    requireObject(data_, "segment");

    key_ = stringOr(data_, "key");
    version_ = intOr(data_, "version");
    deleted_ = boolOr(data_, "deleted");
    if (deleted_) {
        return;
    }

    std::vector<std::string> errors;

    included_ = stringList(data_, "included");
    excluded_ = stringList(data_, "excluded");
    includedContexts_ = parseTargets(arrayOr(data_, "includedContexts"));
    excludedContexts_ = parseTargets(arrayOr(data_, "excludedContexts"));

    for (const auto& ruleData : arrayOr(data_, "rules")) {
        requireObject(ruleData, "segment rule");
        SegmentRule rule;
        rule.id = stringOr(ruleData, "id");
        for (const auto& clauseData : arrayOr(ruleData, "clauses")) {
            requireObject(clauseData, "clause");
            rule.clauses.emplace_back(clauseData, errors);
        }
        rule.weight = optionalInt(ruleData, "weight");
        rule.bucketBy = stringOr(ruleData, "bucketBy");
        rule.rolloutContextKind = stringOr(ruleData, "rolloutContextKind");
        rules_.push_back(std::move(rule));
    }

    unbounded_ = boolOr(data_, "unbounded");
    unboundedContextKind_ = stringOr(data_, "unboundedContextKind", DEFAULT_CONTEXT_KIND);
    generation_ = optionalInt(data_, "generation");
    salt_ = stringOr(data_, "salt");

    for (const auto& message : errors) {
        MODEL_LOG_WARN("Data inconsistency in segment \"{}\": {}", key_, message);
    }
}

std::vector<SegmentTarget> Segment::parseTargets(const nlohmann::json& data) {
    std::vector<SegmentTarget> targets;
    for (const auto& targetData : data) {
        requireObject(targetData, "segment target");
        SegmentTarget target;
        target.contextKind = stringOr(targetData, "contextKind");
        for (auto& value : stringList(targetData, "values")) {
            target.values.insert(std::move(value));
        }
        targets.push_back(std::move(target));
    }
    return targets;
}

} // namespace flagstore
