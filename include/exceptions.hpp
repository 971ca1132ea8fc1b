#pragma once

#include "type_definitions.hpp"
#include <chrono>
#include <exception>
#include <string>

namespace flagstore {

// Consolidated error codes organized by category
enum class ErrorCode {
  // Validation errors (1000-1999)
  INVALID_INPUT = 1000,
  MISSING_FIELD = 1001,
  INVALID_FORMAT = 1002,
  INVALID_RANGE = 1003,
  INVALID_TYPE = 1004,

  // System errors (3000-3999)
  STORE_UNAVAILABLE = 3000,
  STORE_OPERATION_FAILED = 3001,
  NETWORK_ERROR = 3002,
  FILE_ERROR = 3003,
  LOCK_TIMEOUT = 3004,
  CONFIGURATION_ERROR = 3006,

  // Data errors (4000-4999)
  DATA_INCONSISTENCY = 4000,
  DECODE_FAILED = 4001,
  UNKNOWN_DATA_KIND = 4002
};

// Error context for additional debugging information
using ErrorContext = StringMap;

struct ErrorCodeInfo {
  const char *description;
  const char *category;
  bool retryable;
};

const ErrorCodeInfo &getErrorCodeInfo(ErrorCode code);
const char *getErrorCodeDescription(ErrorCode code);

// Base exception with error code, context and correlation ID support
class FlagStoreException : public std::exception {
public:
  FlagStoreException(ErrorCode code, std::string message,
                     ErrorContext context = {});

  FlagStoreException(const FlagStoreException &other) = default;
  FlagStoreException &operator=(const FlagStoreException &other) = default;
  FlagStoreException(FlagStoreException &&other) noexcept = default;
  FlagStoreException &operator=(FlagStoreException &&other) noexcept = default;

  ~FlagStoreException() override = default;

  ErrorCode getCode() const { return errorCode_; }
  const std::string &getMessage() const { return message_; }
  const ErrorContext &getContext() const { return context_; }
  const std::string &getCorrelationId() const { return correlationId_; }
  std::chrono::system_clock::time_point getTimestamp() const {
    return timestamp_;
  }

  const char *what() const noexcept override { return message_.c_str(); }

  virtual std::string toLogString() const;
  std::string toJsonString() const;

  void addContext(const std::string &key, const std::string &value);
  void setCorrelationId(const std::string &correlationId);

protected:
  ErrorCode errorCode_;
  std::string message_;
  ErrorContext context_;
  std::string correlationId_;
  std::chrono::system_clock::time_point timestamp_;

  static std::string generateCorrelationId();
};

// Malformed payloads: non-object records, wrongly typed fields
class ValidationException : public FlagStoreException {
public:
  ValidationException(ErrorCode code, std::string message,
                      std::string field = "", std::string value = "",
                      ErrorContext context = {});

  const std::string &getField() const { return field_; }
  const std::string &getValue() const { return value_; }

  std::string toLogString() const override;

private:
  std::string field_;
  std::string value_;
};

// Infrastructure failures: persistent stores, locks, configuration files
class SystemException : public FlagStoreException {
public:
  SystemException(ErrorCode code, std::string message,
                  std::string component = "", ErrorContext context = {});

  const std::string &getComponent() const { return component_; }

  std::string toLogString() const override;

private:
  std::string component_;
};

ValidationException createValidationError(const std::string &field,
                                          const std::string &value,
                                          const std::string &reason);

SystemException createSystemError(ErrorCode code, const std::string &component,
                                  const std::string &details);

bool isValidationError(const std::exception &ex);
bool isSystemError(const std::exception &ex);

template <typename ExceptionType>
const ExceptionType *asException(const std::exception &ex) {
  return dynamic_cast<const ExceptionType *>(&ex);
}

// Message of an in-flight exception, for logging at a catch site
std::string describeException(const std::exception_ptr &error);

} // namespace flagstore
