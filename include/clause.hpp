#pragma once

#include "attribute_reference.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace flagstore {

constexpr const char *DEFAULT_CONTEXT_KIND = "user";
constexpr const char *SEGMENT_MATCH_OPERATOR = "segmentMatch";

/**
 * One condition of a flag or segment rule. For the segmentMatch operator the
 * values are segment keys and no attribute is parsed.
 */
class Clause {
public:
  // Problems with the attribute are appended to errorsOut
  Clause(const nlohmann::json &data, std::vector<std::string> &errorsOut);

  const std::string &getContextKind() const { return contextKind_; }
  std::string effectiveContextKind() const;
  const std::optional<AttributeReference> &getAttribute() const {
    return attribute_;
  }
  const std::string &getOp() const { return op_; }
  const nlohmann::json &getValues() const { return values_; }
  bool isNegated() const { return negate_; }

  bool isSegmentMatch() const { return op_ == SEGMENT_MATCH_OPERATOR; }

  // Segment keys referenced by a segmentMatch clause
  std::vector<std::string> segmentKeys() const;

  static std::vector<std::string>
  segmentKeysFromClauses(const std::vector<Clause> &clauses);

private:
  std::string contextKind_;
  std::optional<AttributeReference> attribute_;
  std::string op_;
  nlohmann::json values_;
  bool negate_;
};

} // namespace flagstore
