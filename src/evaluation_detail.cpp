#include "evaluation_detail.hpp"

namespace flagstore {

EvaluationReason EvaluationReason::off() {
    return EvaluationReason(Kind::OFF);
}

EvaluationReason EvaluationReason::fallthrough(bool inExperiment) {
    EvaluationReason reason(Kind::FALLTHROUGH);
    reason.inExperiment_ = inExperiment;
    return reason;
}

EvaluationReason EvaluationReason::targetMatch() {
    return EvaluationReason(Kind::TARGET_MATCH);
}

EvaluationReason EvaluationReason::ruleMatch(int ruleIndex, std::string ruleId, bool inExperiment) {
    EvaluationReason reason(Kind::RULE_MATCH);
    reason.ruleIndex_ = ruleIndex;
    reason.ruleId_ = std::move(ruleId);
    reason.inExperiment_ = inExperiment;
    return reason;
}

EvaluationReason EvaluationReason::prerequisiteFailed(std::string prerequisiteKey) {
    EvaluationReason reason(Kind::PREREQUISITE_FAILED);
    reason.prerequisiteKey_ = std::move(prerequisiteKey);
    return reason;
}

EvaluationReason EvaluationReason::error(ErrorKind errorKind) {
    EvaluationReason reason(Kind::ERROR);
    reason.errorKind_ = errorKind;
    return reason;
}

const char* EvaluationReason::kindToString(Kind kind) {
    switch (kind) {
    case Kind::OFF: return "OFF";
    case Kind::FALLTHROUGH: return "FALLTHROUGH";
    case Kind::TARGET_MATCH: return "TARGET_MATCH";
    case Kind::RULE_MATCH: return "RULE_MATCH";
    case Kind::PREREQUISITE_FAILED: return "PREREQUISITE_FAILED";
    case Kind::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

const char* EvaluationReason::errorKindToString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NONE: return "NONE";
    case ErrorKind::CLIENT_NOT_READY: return "CLIENT_NOT_READY";
    case ErrorKind::FLAG_NOT_FOUND: return "FLAG_NOT_FOUND";
    case ErrorKind::MALFORMED_FLAG: return "MALFORMED_FLAG";
    case ErrorKind::USER_NOT_SPECIFIED: return "USER_NOT_SPECIFIED";
    case ErrorKind::EXCEPTION: return "EXCEPTION";
    }
    return "UNKNOWN";
}

nlohmann::json EvaluationReason::toJson() const {
    nlohmann::json out = {{"kind", kindToString(kind_)}};

    switch (kind_) {
    case Kind::RULE_MATCH:
        out["ruleIndex"] = ruleIndex_;
        out["ruleId"] = ruleId_;
        if (inExperiment_) out["inExperiment"] = true;
        break;
    case Kind::FALLTHROUGH:
        if (inExperiment_) out["inExperiment"] = true;
        break;
    case Kind::PREREQUISITE_FAILED:
        out["prerequisiteKey"] = prerequisiteKey_;
        break;
    case Kind::ERROR:
        out["errorKind"] = errorKindToString(errorKind_);
        break;
    default:
        break;
    }
    return out;
}

std::string EvaluationReason::toString() const {
    switch (kind_) {
    case Kind::RULE_MATCH:
        return "RULE_MATCH(" + std::to_string(ruleIndex_) +
               (ruleId_.empty() ? "" : "," + ruleId_) + ")";
    case Kind::PREREQUISITE_FAILED:
        return "PREREQUISITE_FAILED(" + prerequisiteKey_ + ")";
    case Kind::ERROR:
        return std::string("ERROR(") + errorKindToString(errorKind_) + ")";
    default:
        return kindToString(kind_);
    }
}

bool EvaluationReason::operator==(const EvaluationReason& other) const {
    return kind_ == other.kind_ && errorKind_ == other.errorKind_ &&
           ruleIndex_ == other.ruleIndex_ && ruleId_ == other.ruleId_ &&
           prerequisiteKey_ == other.prerequisiteKey_ &&
           inExperiment_ == other.inExperiment_;
}

nlohmann::json EvaluationDetail::toJson() const {
    nlohmann::json out = {{"value", value}, {"reason", reason.toJson()}};
    out["variationIndex"] = variationIndex ? nlohmann::json(*variationIndex) : nlohmann::json(nullptr);
    return out;
}

} // namespace flagstore
