#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace flagstore {

/**
 * Parsed form of a clause attribute. A reference either names a top-level
 * attribute literally or addresses a nested property with a slash path
 * ("/address/street"), where "~0" escapes '~' and "~1" escapes '/'.
 */
class AttributeReference {
public:
  static constexpr const char *ERR_EMPTY = "empty reference";
  static constexpr const char *ERR_INVALID_ESCAPE_SEQUENCE =
      "invalid escape sequence";
  static constexpr const char *ERR_DOUBLE_TRAILING_SLASH =
      "double or trailing slash";

  // Path syntax
  static AttributeReference create(const std::string &value);
  // Clause payload form; anything but a string is an empty reference
  static AttributeReference fromJson(const nlohmann::json &value);

  // Plain attribute name; no path interpretation
  static AttributeReference createLiteral(const std::string &value);
  static AttributeReference literalFromJson(const nlohmann::json &value);

  bool isValid() const { return !error_.has_value(); }
  const std::optional<std::string> &getError() const { return error_; }
  const std::string &getRawPath() const { return rawPath_; }

  std::size_t depth() const { return components_.size(); }
  std::optional<std::string> component(std::size_t index) const;

  bool operator==(const AttributeReference &other) const {
    return error_ == other.error_ && components_ == other.components_;
  }
  bool operator!=(const AttributeReference &other) const {
    return !(*this == other);
  }

private:
  AttributeReference(std::string rawPath, std::vector<std::string> components,
                     std::optional<std::string> error = std::nullopt)
      : rawPath_(std::move(rawPath)), components_(std::move(components)),
        error_(std::move(error)) {}

  std::string rawPath_;
  std::vector<std::string> components_;
  std::optional<std::string> error_;
};

} // namespace flagstore
