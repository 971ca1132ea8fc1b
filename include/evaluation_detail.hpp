#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace flagstore {

/**
 * Why an evaluation produced the value it did. Instances are built once per
 * flag version by the precomputation step and shared by every evaluation.
 */
class EvaluationReason {
public:
  enum class Kind {
    OFF,
    FALLTHROUGH,
    TARGET_MATCH,
    RULE_MATCH,
    PREREQUISITE_FAILED,
    ERROR
  };

  enum class ErrorKind {
    NONE,
    CLIENT_NOT_READY,
    FLAG_NOT_FOUND,
    MALFORMED_FLAG,
    USER_NOT_SPECIFIED,
    EXCEPTION
  };

  static EvaluationReason off();
  static EvaluationReason fallthrough(bool inExperiment = false);
  static EvaluationReason targetMatch();
  static EvaluationReason ruleMatch(int ruleIndex, std::string ruleId,
                                    bool inExperiment = false);
  static EvaluationReason prerequisiteFailed(std::string prerequisiteKey);
  static EvaluationReason error(ErrorKind errorKind);

  Kind getKind() const { return kind_; }
  ErrorKind getErrorKind() const { return errorKind_; }
  int getRuleIndex() const { return ruleIndex_; }
  const std::string &getRuleId() const { return ruleId_; }
  const std::string &getPrerequisiteKey() const { return prerequisiteKey_; }
  bool isInExperiment() const { return inExperiment_; }

  nlohmann::json toJson() const;
  std::string toString() const;

  bool operator==(const EvaluationReason &other) const;
  bool operator!=(const EvaluationReason &other) const {
    return !(*this == other);
  }

  static const char *kindToString(Kind kind);
  static const char *errorKindToString(ErrorKind kind);

private:
  explicit EvaluationReason(Kind kind) : kind_(kind) {}

  Kind kind_;
  ErrorKind errorKind_ = ErrorKind::NONE;
  int ruleIndex_ = -1;
  std::string ruleId_;
  std::string prerequisiteKey_;
  bool inExperiment_ = false;
};

// Result of evaluating a flag: value, variation index and reason
struct EvaluationDetail {
  nlohmann::json value;
  std::optional<int> variationIndex;
  EvaluationReason reason;

  EvaluationDetail(nlohmann::json v, std::optional<int> index,
                   EvaluationReason r)
      : value(std::move(v)), variationIndex(index), reason(std::move(r)) {}

  bool isDefaultValue() const { return !variationIndex.has_value(); }

  nlohmann::json toJson() const;

  bool operator==(const EvaluationDetail &other) const {
    return value == other.value && variationIndex == other.variationIndex &&
           reason == other.reason;
  }
  bool operator!=(const EvaluationDetail &other) const {
    return !(*this == other);
  }
};

} // namespace flagstore
