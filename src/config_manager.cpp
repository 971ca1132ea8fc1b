#include "config_manager.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace flagstore {

namespace {

std::string toUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), ::toupper);
  return value;
}

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), ::tolower);
  return value;
}

} // namespace

ConfigManager &ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

bool ConfigManager::loadConfig(const std::string &configPath) {
  CONFIG_LOG_INFO("Loading configuration from: {}", configPath);

  std::ifstream file(configPath);
  if (!file.is_open()) {
    CONFIG_LOG_ERROR("Cannot open config file: {}", configPath);
    return false;
  }

  nlohmann::json jsonConfig;
  try {
    file >> jsonConfig;
  } catch (const nlohmann::json::exception &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON config file {}: {}", configPath,
                     e.what());
    return false;
  }

  bool result = applyParsedConfig(jsonConfig);
  if (result) {
    ScopedTimedLock<ConfigSharedMutex> lock(configMutex_);
    configFilePath_ = configPath;
  }
  return result;
}

bool ConfigManager::loadConfigFromString(const std::string &jsonText) {
  nlohmann::json jsonConfig;
  try {
    jsonConfig = nlohmann::json::parse(jsonText);
  } catch (const nlohmann::json::exception &e) {
    CONFIG_LOG_ERROR("Failed to parse JSON configuration: {}", e.what());
    return false;
  }
  return applyParsedConfig(jsonConfig);
}

bool ConfigManager::reloadConfiguration() {
  std::string path;
  {
    ScopedTimedSharedLock<ConfigSharedMutex> lock(configMutex_);
    path = configFilePath_;
  }
  if (path.empty()) {
    CONFIG_LOG_ERROR("No configuration file path available for reload");
    return false;
  }
  return loadConfig(path);
}

bool ConfigManager::applyParsedConfig(const nlohmann::json &jsonConfig) {
  if (!jsonConfig.is_object()) {
    CONFIG_LOG_ERROR("Configuration root must be a JSON object");
    return false;
  }

  ScopedTimedLock<ConfigSharedMutex> lock(configMutex_);
  configData_.clear();
  rawConfig_ = jsonConfig;
  flattenJson(rawConfig_, "", 0, 100);

  CONFIG_LOG_INFO("Configuration loaded successfully with {} parameters",
                  configData_.size());
  return true;
}

void ConfigManager::flattenJson(const nlohmann::json &json,
                                const std::string &prefix, int currentDepth,
                                int maxDepth) {
  if (currentDepth >= maxDepth) {
    std::string key = prefix.empty() ? "deep_nested" : prefix + ".deep_nested";
    configData_[key] = json.dump();
    return;
  }

  for (auto it = json.begin(); it != json.end(); ++it) {
    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

    if (it->is_object()) {
      flattenJson(*it, key, currentDepth + 1, maxDepth);
    } else if (it->is_string()) {
      configData_[key] = it->get<std::string>();
    } else if (it->is_number_integer()) {
      configData_[key] = std::to_string(it->get<long long>());
    } else if (it->is_boolean()) {
      configData_[key] = it->get<bool>() ? "true" : "false";
    } else {
      // Arrays and floats keep their JSON text
      configData_[key] = it->dump();
    }
  }
}

std::string ConfigManager::getString(const std::string &key,
                                     const std::string &defaultValue) const {
  ScopedTimedSharedLock<ConfigSharedMutex> lock(configMutex_);
  if (auto it = configData_.find(key); it != configData_.end()) {
    return it->second;
  }
  return defaultValue;
}

int ConfigManager::getInt(const std::string &key, int defaultValue) const {
  auto raw = getString(key);
  if (raw.empty()) {
    return defaultValue;
  }
  try {
    return std::stoi(raw);
  } catch (const std::invalid_argument &) {
    return defaultValue;
  } catch (const std::out_of_range &) {
    return defaultValue;
  }
}

bool ConfigManager::getBool(const std::string &key, bool defaultValue) const {
  if (!hasKey(key)) {
    return defaultValue;
  }
  auto value = toLower(getString(key));
  return value == "true" || value == "1" || value == "yes" || value == "on";
}

double ConfigManager::getDouble(const std::string &key,
                                double defaultValue) const {
  auto raw = getString(key);
  if (raw.empty()) {
    return defaultValue;
  }
  try {
    return std::stod(raw);
  } catch (const std::invalid_argument &) {
    return defaultValue;
  } catch (const std::out_of_range &) {
    return defaultValue;
  }
}

StringSet ConfigManager::getStringSet(const std::string &key) const {
  StringSet result;
  auto raw = getString(key);
  if (raw.empty()) {
    return result;
  }

  if (raw.front() == '[') {
    auto arr = nlohmann::json::parse(raw, nullptr, false);
    if (arr.is_array()) {
      for (const auto &v : arr) {
        if (v.is_string()) {
          result.insert(v.get<std::string>());
        }
      }
      return result;
    }
  }

  // Comma separated form
  std::stringstream ss(raw);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item.erase(0, item.find_first_not_of(" \t\""));
    item.erase(item.find_last_not_of(" \t\"") + 1);
    if (!item.empty()) {
      result.insert(item);
    }
  }
  return result;
}

bool ConfigManager::hasKey(const std::string &key) const {
  ScopedTimedSharedLock<ConfigSharedMutex> lock(configMutex_);
  return configData_.find(key) != configData_.end();
}

const nlohmann::json &ConfigManager::getJsonConfig() const {
  return rawConfig_;
}

LogConfig ConfigManager::getLoggingConfig() const {
  LogConfig config;

  config.level = parseLogLevel(getString("logging.level", "INFO"));
  config.format = parseLogFormat(getString("logging.format", "TEXT"));
  config.consoleOutput = getBool("logging.console_output", true);
  config.fileOutput = getBool("logging.file_output", false);
  config.asyncLogging = getBool("logging.async_logging", false);
  config.logFile = getString("logging.log_file", "logs/flagstore.log");
  config.maxFileSize =
      static_cast<size_t>(getInt("logging.max_file_size", 10485760));
  config.maxBackupFiles = getInt("logging.max_backup_files", 5);
  config.enableRotation = getBool("logging.enable_rotation", true);
  config.componentFilter = getStringSet("logging.component_filter");
  config.maxQueueSize =
      static_cast<size_t>(getInt("logging.max_queue_size", 10000));

  return config;
}

DataStoreConfig ConfigManager::getDataStoreConfig() const {
  return DataStoreConfig::fromConfig(*this);
}

RedisStoreConfig ConfigManager::getRedisStoreConfig() const {
  return RedisStoreConfig::fromConfig(*this);
}

ConfigValidationResult ConfigManager::validateConfiguration() const {
  ConfigValidationResult result;

  auto merge = [&result](const ConfigValidationResult &section) {
    result.isValid = result.isValid && section.isValid;
    result.errors.insert(result.errors.end(), section.errors.begin(),
                         section.errors.end());
    result.warnings.insert(result.warnings.end(), section.warnings.begin(),
                           section.warnings.end());
  };

  merge(getDataStoreConfig().validate());
  if (hasKey("redis.host") || hasKey("redis.port")) {
    merge(getRedisStoreConfig().validate());
  }

  return result;
}

LogLevel ConfigManager::parseLogLevel(const std::string &levelStr) {
  auto level = toUpper(levelStr);

  if (level == "DEBUG")
    return LogLevel::DEBUG;
  if (level == "INFO")
    return LogLevel::INFO;
  if (level == "WARN" || level == "WARNING")
    return LogLevel::WARN;
  if (level == "ERROR")
    return LogLevel::ERROR;
  if (level == "FATAL")
    return LogLevel::FATAL;

  return LogLevel::INFO;
}

LogFormat ConfigManager::parseLogFormat(const std::string &formatStr) {
  if (toUpper(formatStr) == "JSON")
    return LogFormat::JSON;
  return LogFormat::TEXT;
}

// ===== DataStoreConfig Implementation =====

DataStoreConfig DataStoreConfig::fromConfig(const ConfigManager &config) {
  DataStoreConfig storeConfig;

  auto mode = toLower(config.getString("data_store.mode", "read_write"));
  storeConfig.mode = mode == "read_only" ? Mode::READ_ONLY : Mode::READ_WRITE;
  storeConfig.pollInterval = std::chrono::milliseconds(
      config.getInt("data_store.poll_interval_ms", 500));
  storeConfig.lockTimeout = std::chrono::milliseconds(
      config.getInt("data_store.lock_timeout_ms", 5000));

  if (mode != "read_only" && mode != "read_write") {
    CONFIG_LOG_WARN("Unknown data_store.mode '{}', using read_write", mode);
  }

  return storeConfig;
}

ConfigValidationResult DataStoreConfig::validate() const {
  ConfigValidationResult result;

  if (pollInterval.count() <= 0) {
    std::stringstream ss;
    ss << "data_store.poll_interval_ms must be positive, got: "
       << pollInterval.count();
    result.addError(ss.str());
  } else if (pollInterval.count() > 60000) {
    std::stringstream ss;
    ss << "data_store.poll_interval_ms is very high (" << pollInterval.count()
       << "ms), store outages will be detected slowly";
    result.addWarning(ss.str());
  }

  if (lockTimeout.count() <= 0) {
    std::stringstream ss;
    ss << "data_store.lock_timeout_ms must be positive, got: "
       << lockTimeout.count();
    result.addError(ss.str());
  }

  return result;
}

bool DataStoreConfig::operator==(const DataStoreConfig &other) const {
  return mode == other.mode && pollInterval == other.pollInterval &&
         lockTimeout == other.lockTimeout;
}

// ===== RedisStoreConfig Implementation =====

RedisStoreConfig RedisStoreConfig::fromConfig(const ConfigManager &config) {
  RedisStoreConfig redisConfig;

  redisConfig.host = config.getString("redis.host", "127.0.0.1");
  redisConfig.port = config.getInt("redis.port", 6379);
  redisConfig.db = config.getInt("redis.db", 0);
  redisConfig.password = config.getString("redis.password", "");
  redisConfig.prefix = config.getString("redis.prefix", "launchdarkly");
  redisConfig.connectTimeout = std::chrono::milliseconds(
      config.getInt("redis.connect_timeout_ms", 2000));

  return redisConfig;
}

ConfigValidationResult RedisStoreConfig::validate() const {
  ConfigValidationResult result;

  if (host.empty()) {
    result.addError("redis.host must not be empty");
  }

  if (port <= 0 || port > 65535) {
    std::stringstream ss;
    ss << "redis.port must be between 1 and 65535, got: " << port;
    result.addError(ss.str());
  }

  if (db < 0) {
    std::stringstream ss;
    ss << "redis.db must not be negative, got: " << db;
    result.addError(ss.str());
  }

  if (prefix.empty()) {
    result.addWarning("redis.prefix is empty, keys will share the root namespace");
  }

  if (connectTimeout.count() <= 0) {
    std::stringstream ss;
    ss << "redis.connect_timeout_ms must be positive, got: "
       << connectTimeout.count();
    result.addError(ss.str());
  }

  return result;
}

bool RedisStoreConfig::operator==(const RedisStoreConfig &other) const {
  return host == other.host && port == other.port && db == other.db &&
         password == other.password && prefix == other.prefix &&
         connectTimeout == other.connectTimeout;
}

} // namespace flagstore
