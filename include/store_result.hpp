#pragma once

#include "exceptions.hpp"
#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace flagstore {

/**
 * Outcome of an operation against a persistent store. A failure keeps the
 * original exception so callers can rethrow or inspect it.
 */
template <typename T> struct StoreResult {
  std::optional<T> value;
  bool success = false;
  std::string errorMessage;
  std::exception_ptr error;

  static StoreResult ok(T result) {
    StoreResult r;
    r.value = std::move(result);
    r.success = true;
    return r;
  }

  static StoreResult failure(std::exception_ptr ex) {
    StoreResult r;
    r.error = ex;
    r.errorMessage = describeException(ex);
    return r;
  }

  explicit operator bool() const { return success; }

  // Returns the value or rethrows the stored exception
  const T &valueOrThrow() const {
    if (!success) {
      std::rethrow_exception(error);
    }
    return *value;
  }
};

template <> struct StoreResult<void> {
  bool success = false;
  std::string errorMessage;
  std::exception_ptr error;

  static StoreResult ok() {
    StoreResult r;
    r.success = true;
    return r;
  }

  static StoreResult failure(std::exception_ptr ex) {
    StoreResult r;
    r.error = ex;
    r.errorMessage = describeException(ex);
    return r;
  }

  explicit operator bool() const { return success; }

  void throwIfFailed() const {
    if (!success) {
      std::rethrow_exception(error);
    }
  }
};

} // namespace flagstore
