#include "clause.hpp"
#include "json_fields.hpp"

namespace flagstore {

Clause::Clause(const nlohmann::json& data, std::vector<std::string>& errorsOut)
    : contextKind_(json_fields::stringOr(data, "contextKind")),
      op_(json_fields::stringOr(data, "op")),
      values_(json_fields::arrayOr(data, "values")),
      negate_(json_fields::boolOr(data, "negate")) {

    if (isSegmentMatch()) {
        return;
    }

    const auto& attribute = json_fields::field(data, "attribute");
    attribute_ = contextKind_.empty() ? AttributeReference::literalFromJson(attribute)
                                      : AttributeReference::fromJson(attribute);
    if (!attribute_->isValid()) {
        errorsOut.push_back("clause has invalid attribute: " + *attribute_->getError());
    }
}

std::string Clause::effectiveContextKind() const {
    return contextKind_.empty() ? DEFAULT_CONTEXT_KIND : contextKind_;
}

std::vector<std::string> Clause::segmentKeys() const {
    std::vector<std::string> keys;
    if (!isSegmentMatch()) {
        return keys;
    }
    for (const auto& value : values_) {
        if (value.is_string()) {
            keys.push_back(value.get<std::string>());
        }
    }
    return keys;
}

std::vector<std::string> Clause::segmentKeysFromClauses(const std::vector<Clause>& clauses) {
    std::vector<std::string> keys;
    for (const auto& clause : clauses) {
        auto clauseKeys = clause.segmentKeys();
        keys.insert(keys.end(), clauseKeys.begin(), clauseKeys.end());
    }
    return keys;
}

} // namespace flagstore
