#pragma once

#include "exceptions.hpp"
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Typed field access for item payloads. A missing or null field yields the
// default; a field of the wrong type raises ValidationException.
namespace flagstore::json_fields {

inline const nlohmann::json &field(const nlohmann::json &object,
                                   const char *name) {
  static const nlohmann::json null_value;
  auto it = object.find(name);
  return it == object.end() ? null_value : *it;
}

inline void requireObject(const nlohmann::json &value, const char *what) {
  if (!value.is_object()) {
    throw ValidationException(ErrorCode::INVALID_TYPE,
                              std::string("expected object for ") + what +
                                  " but got " + value.type_name(),
                              what, value.type_name());
  }
}

[[noreturn]] inline void wrongType(const char *name, const char *expected,
                                   const nlohmann::json &value) {
  throw ValidationException(ErrorCode::INVALID_TYPE,
                            std::string("field '") + name + "' should be " +
                                expected + " but is " + value.type_name(),
                            name, value.dump());
}

inline std::string stringOr(const nlohmann::json &object, const char *name,
                            const std::string &defaultValue = "") {
  const auto &value = field(object, name);
  if (value.is_null())
    return defaultValue;
  if (!value.is_string())
    wrongType(name, "a string", value);
  return value.get<std::string>();
}

inline std::optional<std::string> optionalString(const nlohmann::json &object,
                                                 const char *name) {
  const auto &value = field(object, name);
  if (value.is_null())
    return std::nullopt;
  if (!value.is_string())
    wrongType(name, "a string", value);
  return value.get<std::string>();
}

inline int64_t intOr(const nlohmann::json &object, const char *name,
                     int64_t defaultValue = 0) {
  const auto &value = field(object, name);
  if (value.is_null())
    return defaultValue;
  if (!value.is_number_integer())
    wrongType(name, "an integer", value);
  return value.get<int64_t>();
}

inline std::optional<int64_t> optionalInt(const nlohmann::json &object,
                                          const char *name) {
  const auto &value = field(object, name);
  if (value.is_null())
    return std::nullopt;
  if (!value.is_number_integer())
    wrongType(name, "an integer", value);
  return value.get<int64_t>();
}

// Marks an index too large for int; never a valid position
constexpr int OUT_OF_RANGE_INDEX = -1;

inline std::optional<int> optionalIndex(const nlohmann::json &object,
                                        const char *name) {
  auto value = optionalInt(object, name);
  if (!value)
    return std::nullopt;
  if (*value < std::numeric_limits<int>::min() ||
      *value > std::numeric_limits<int>::max())
    return OUT_OF_RANGE_INDEX;
  return static_cast<int>(*value);
}

inline bool boolOr(const nlohmann::json &object, const char *name,
                   bool defaultValue = false) {
  const auto &value = field(object, name);
  if (value.is_null())
    return defaultValue;
  if (!value.is_boolean())
    wrongType(name, "a boolean", value);
  return value.get<bool>();
}

inline std::optional<double> optionalNumber(const nlohmann::json &object,
                                            const char *name) {
  const auto &value = field(object, name);
  if (value.is_null())
    return std::nullopt;
  if (!value.is_number())
    wrongType(name, "a number", value);
  return value.get<double>();
}

inline const nlohmann::json &arrayOr(const nlohmann::json &object,
                                     const char *name) {
  static const nlohmann::json empty_array = nlohmann::json::array();
  const auto &value = field(object, name);
  if (value.is_null())
    return empty_array;
  if (!value.is_array())
    wrongType(name, "an array", value);
  return value;
}

inline const nlohmann::json &objectOr(const nlohmann::json &object,
                                      const char *name) {
  static const nlohmann::json empty_object = nlohmann::json::object();
  const auto &value = field(object, name);
  if (value.is_null())
    return empty_object;
  if (!value.is_object())
    wrongType(name, "an object", value);
  return value;
}

inline std::vector<std::string> stringList(const nlohmann::json &object,
                                           const char *name) {
  std::vector<std::string> out;
  for (const auto &entry : arrayOr(object, name)) {
    if (!entry.is_string())
      wrongType(name, "an array of strings", entry);
    out.push_back(entry.get<std::string>());
  }
  return out;
}

} // namespace flagstore::json_fields
