#pragma once

#include "change_set.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace flagstore {

enum class DataSourceState { INITIALIZING, VALID, INTERRUPTED, OFF };

const char *dataSourceStateToString(DataSourceState state);

struct DataSourceErrorInfo {
  enum class Kind {
    UNKNOWN,
    NETWORK_ERROR,
    ERROR_RESPONSE,
    INVALID_DATA,
    STORE_ERROR
  };

  Kind kind = Kind::UNKNOWN;
  int statusCode = 0; // HTTP status for ERROR_RESPONSE
  std::string message;
  std::chrono::system_clock::time_point time = std::chrono::system_clock::now();

  static const char *kindToString(Kind kind);
  std::string toString() const;

  bool operator==(const DataSourceErrorInfo &other) const {
    return kind == other.kind && statusCode == other.statusCode &&
           message == other.message && time == other.time;
  }
  bool operator!=(const DataSourceErrorInfo &other) const {
    return !(*this == other);
  }
};

// One item of a synchronizer's update stream
struct Update {
  DataSourceState state = DataSourceState::VALID;
  std::optional<ChangeSet> changeSet;
  std::optional<DataSourceErrorInfo> error;
  bool fallbackRequested = false;
  std::optional<std::string> environmentId;
};

struct BasisResult {
  std::optional<Basis> basis;
  std::string errorMessage;

  static BasisResult success(Basis value) {
    BasisResult result;
    result.basis = std::move(value);
    return result;
  }
  static BasisResult failure(std::string message) {
    BasisResult result;
    result.errorMessage = std::move(message);
    return result;
  }

  bool isSuccess() const { return basis.has_value(); }
};

// Gives update sources the selector to resume from
class SelectorStore {
public:
  virtual ~SelectorStore() = default;
  virtual Selector selector() const = 0;
};

// One-shot source of a full data set
class Initializer {
public:
  virtual ~Initializer() = default;
  virtual std::string name() const = 0;
  virtual BasisResult fetch(const SelectorStore &selectorStore) = 0;
};

/**
 * Long-lived source of updates. sync() blocks, passing each update to the
 * handler, until the handler returns false or stop() is called.
 */
class Synchronizer {
public:
  using UpdateHandler = std::function<bool(const Update &)>;

  virtual ~Synchronizer() = default;
  virtual std::string name() const = 0;
  virtual void sync(const SelectorStore &selectorStore,
                    const UpdateHandler &handler) = 0;
  virtual void stop() = 0;
};

} // namespace flagstore
