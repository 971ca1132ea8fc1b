#pragma once

#include "lock_utils.hpp"
#include "logger.hpp"
#include "type_definitions.hpp"
#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <vector>

namespace flagstore {

class ConfigManager;

// Configuration validation result
struct ConfigValidationResult {
  bool isValid = true;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  void addError(const std::string &error) {
    isValid = false;
    errors.push_back(error);
  }

  void addWarning(const std::string &warning) { warnings.push_back(warning); }
};

// Data store section ("data_store.*")
struct DataStoreConfig {
  enum class Mode { READ_ONLY, READ_WRITE };

  Mode mode = Mode::READ_WRITE;
  std::chrono::milliseconds pollInterval{500};
  std::chrono::milliseconds lockTimeout{5000};

  bool writable() const { return mode == Mode::READ_WRITE; }

  static DataStoreConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
  bool operator==(const DataStoreConfig &other) const;
};

// Redis section ("redis.*")
struct RedisStoreConfig {
  std::string host = "127.0.0.1";
  int port = 6379;
  int db = 0;
  std::string password;
  std::string prefix = "launchdarkly";
  std::chrono::milliseconds connectTimeout{2000};

  static RedisStoreConfig fromConfig(const ConfigManager &config);
  ConfigValidationResult validate() const;
  bool operator==(const RedisStoreConfig &other) const;
};

class ConfigManager {
public:
  static ConfigManager &getInstance();

  bool loadConfig(const std::string &configPath);
  bool loadConfigFromString(const std::string &jsonText);
  bool reloadConfiguration();

  std::string getString(const std::string &key,
                        const std::string &defaultValue = "") const;
  int getInt(const std::string &key, int defaultValue = 0) const;
  bool getBool(const std::string &key, bool defaultValue = false) const;
  double getDouble(const std::string &key, double defaultValue = 0.0) const;
  StringSet getStringSet(const std::string &key) const;
  bool hasKey(const std::string &key) const;

  // Logging configuration helpers
  LogConfig getLoggingConfig() const;

  DataStoreConfig getDataStoreConfig() const;
  RedisStoreConfig getRedisStoreConfig() const;

  ConfigValidationResult validateConfiguration() const;

  const nlohmann::json &getJsonConfig() const;

  // Configuration access with validation
  template <typename T>
  T getValidatedValue(
      const std::string &key, const T &defaultValue,
      const std::function<bool(const T &)> &validator = nullptr) const;

private:
  ConfigManager() = default;

  mutable ConfigSharedMutex configMutex_;
  StringMap configData_;
  std::string configFilePath_;
  nlohmann::json rawConfig_;

  bool applyParsedConfig(const nlohmann::json &jsonConfig);
  void flattenJson(const nlohmann::json &json, const std::string &prefix,
                   int currentDepth, int maxDepth);
  static LogLevel parseLogLevel(const std::string &levelStr);
  static LogFormat parseLogFormat(const std::string &formatStr);
};

/**
 * @brief Retrieve a typed configuration value with optional validation.
 *
 * Supported types are std::string, int, bool and double. Returns
 * @p defaultValue when the key is missing or the validator rejects the value.
 */
template <typename T>
T ConfigManager::getValidatedValue(
    const std::string &key, const T &defaultValue,
    const std::function<bool(const T &)> &validator) const {
  T value;

  if constexpr (std::is_same_v<T, std::string>) {
    value = getString(key, defaultValue);
  } else if constexpr (std::is_same_v<T, int>) {
    value = getInt(key, defaultValue);
  } else if constexpr (std::is_same_v<T, bool>) {
    value = getBool(key, defaultValue);
  } else if constexpr (std::is_same_v<T, double>) {
    value = getDouble(key, defaultValue);
  } else {
    static_assert(std::is_same_v<T, std::string> || std::is_same_v<T, int> ||
                      std::is_same_v<T, bool> || std::is_same_v<T, double>,
                  "Unsupported type for getValidatedValue");
    return defaultValue;
  }

  if (validator && !validator(value)) {
    CONFIG_LOG_WARN("Value for '{}' failed validation, using default", key);
    return defaultValue;
  }

  return value;
}

} // namespace flagstore
