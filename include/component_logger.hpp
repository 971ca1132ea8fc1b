#pragma once

#include "logger.hpp"
#include "type_definitions.hpp"
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace flagstore {

// Forward declarations for component traits
template <typename Component> struct ComponentTrait;

// Component trait specializations for type safety and compile-time performance
template <> struct ComponentTrait<class ConfigManager> {
  static constexpr const char *name = "ConfigManager";
};

template <> struct ComponentTrait<class DataModel> {
  static constexpr const char *name = "DataModel";
};

template <> struct ComponentTrait<class InMemoryStore> {
  static constexpr const char *name = "InMemoryStore";
};

template <> struct ComponentTrait<class Store> {
  static constexpr const char *name = "Store";
};

template <> struct ComponentTrait<class PersistentStoreWrapper> {
  static constexpr const char *name = "PersistentStoreWrapper";
};

template <> struct ComponentTrait<class StatusProviderBase> {
  static constexpr const char *name = "StatusProvider";
};

template <> struct ComponentTrait<class RedisDataStore> {
  static constexpr const char *name = "RedisDataStore";
};

template <> struct ComponentTrait<class UpdateProcessor> {
  static constexpr const char *name = "UpdateProcessor";
};

namespace detail {

template <typename T, typename = void> struct is_string_map : std::false_type {};

template <typename T>
struct is_string_map<T, std::void_t<typename T::key_type,
                                    typename T::mapped_type>>
    : std::bool_constant<
          std::is_same_v<typename T::key_type, std::string> &&
          std::is_same_v<typename T::mapped_type, std::string>> {};

} // namespace detail

/**
 * ComponentLogger - Template-based logging with the component name resolved at
 * compile time via ComponentTrait.
 *
 * Messages use "{}" placeholders that are substituted in order:
 *   STORE_LOG_WARN("Couldn't apply changeset: {}", e.what());
 */
template <typename Component> class ComponentLogger {
private:
  static_assert(std::is_class_v<Component>, "Component must be a class type");

  static constexpr const char *component_name = ComponentTrait<Component>::name;

  static Logger &getLogger() { return Logger::getInstance(); }

  template <typename... Args>
  static void emit(LogLevel level, const std::string &message,
                   Args &&...args) {
    if (!getLogger().isEnabled(level, component_name)) {
      return;
    }
    if constexpr (sizeof...(args) > 0) {
      getLogger().log(level, component_name,
                      format_message(message, std::forward<Args>(args)...));
    } else {
      getLogger().log(level, component_name, message);
    }
  }

public:
  template <typename... Args>
  static void debug(const std::string &message, Args &&...args) {
    emit(LogLevel::DEBUG, message, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void info(const std::string &message, Args &&...args) {
    emit(LogLevel::INFO, message, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void warn(const std::string &message, Args &&...args) {
    emit(LogLevel::WARN, message, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void error(const std::string &message, Args &&...args) {
    emit(LogLevel::ERROR, message, std::forward<Args>(args)...);
  }

  template <typename... Args>
  static void fatal(const std::string &message, Args &&...args) {
    emit(LogLevel::FATAL, message, std::forward<Args>(args)...);
  }

  static void warnWithContext(const std::string &message,
                              const LogContext &context = {}) {
    getLogger().warn(component_name, message, context);
  }

  static void errorWithContext(const std::string &message,
                               const LogContext &context = {}) {
    getLogger().error(component_name, message, context);
  }

  static constexpr const char *getComponentName() { return component_name; }

  template <typename... Args>
  static std::string format_message(const std::string &format,
                                    Args &&...args) {
    std::stringstream ss;
    format_impl(ss, format, std::forward<Args>(args)...);
    return ss.str();
  }

private:
  template <typename K, typename V, typename H, typename E>
  static std::string to_string(const std::unordered_map<K, V, H, E> &map) {
    std::stringstream ss;
    ss << "{";
    bool first = true;
    for (const auto &pair : map) {
      if (!first)
        ss << ", ";
      ss << pair.first << ": " << pair.second;
      first = false;
    }
    ss << "}";
    return ss.str();
  }

  template <typename T>
  static void stream_value(std::stringstream &ss, T &&value) {
    using Decayed = std::decay_t<T>;
    if constexpr (detail::is_string_map<Decayed>::value) {
      ss << to_string(value);
    } else if constexpr (std::is_same_v<Decayed, bool>) {
      ss << (value ? "true" : "false");
    } else if constexpr (std::is_arithmetic_v<Decayed> ||
                         std::is_convertible_v<T, std::string_view>) {
      ss << std::forward<T>(value);
    } else {
      ss << "[object]";
    }
  }

  template <typename T, typename... Args>
  static void format_impl(std::stringstream &ss, const std::string &format,
                          T &&arg, Args &&...args) {
    size_t pos = format.find("{}");
    if (pos != std::string::npos) {
      ss << format.substr(0, pos);
      stream_value(ss, std::forward<T>(arg));
      if constexpr (sizeof...(args) > 0) {
        format_impl(ss, format.substr(pos + 2), std::forward<Args>(args)...);
      } else {
        ss << format.substr(pos + 2);
      }
    } else {
      ss << format;
    }
  }

  static void format_impl(std::stringstream &ss, const std::string &format) {
    ss << format;
  }
};

// Convenience type aliases for the library's component loggers
using ConfigLogger = ComponentLogger<class ConfigManager>;
using ModelLogger = ComponentLogger<class DataModel>;
using MemoryStoreLogger = ComponentLogger<class InMemoryStore>;
using StoreLogger = ComponentLogger<class Store>;
using PersistenceLogger = ComponentLogger<class PersistentStoreWrapper>;
using StatusLogger = ComponentLogger<class StatusProviderBase>;
using RedisLogger = ComponentLogger<class RedisDataStore>;
using SourceLogger = ComponentLogger<class UpdateProcessor>;

} // namespace flagstore

#define COMPONENT_LOG_DEBUG(ComponentClass, message, ...)                      \
  flagstore::ComponentLogger<ComponentClass>::debug(message, ##__VA_ARGS__)
#define COMPONENT_LOG_INFO(ComponentClass, message, ...)                       \
  flagstore::ComponentLogger<ComponentClass>::info(message, ##__VA_ARGS__)
#define COMPONENT_LOG_WARN(ComponentClass, message, ...)                       \
  flagstore::ComponentLogger<ComponentClass>::warn(message, ##__VA_ARGS__)
#define COMPONENT_LOG_ERROR(ComponentClass, message, ...)                      \
  flagstore::ComponentLogger<ComponentClass>::error(message, ##__VA_ARGS__)

#define CONFIG_LOG_DEBUG(message, ...)                                         \
  flagstore::ConfigLogger::debug(message, ##__VA_ARGS__)
#define CONFIG_LOG_INFO(message, ...)                                          \
  flagstore::ConfigLogger::info(message, ##__VA_ARGS__)
#define CONFIG_LOG_WARN(message, ...)                                          \
  flagstore::ConfigLogger::warn(message, ##__VA_ARGS__)
#define CONFIG_LOG_ERROR(message, ...)                                         \
  flagstore::ConfigLogger::error(message, ##__VA_ARGS__)

#define MODEL_LOG_DEBUG(message, ...)                                          \
  flagstore::ModelLogger::debug(message, ##__VA_ARGS__)
#define MODEL_LOG_WARN(message, ...)                                           \
  flagstore::ModelLogger::warn(message, ##__VA_ARGS__)
#define MODEL_LOG_ERROR(message, ...)                                          \
  flagstore::ModelLogger::error(message, ##__VA_ARGS__)

#define MEMSTORE_LOG_DEBUG(message, ...)                                       \
  flagstore::MemoryStoreLogger::debug(message, ##__VA_ARGS__)
#define MEMSTORE_LOG_ERROR(message, ...)                                       \
  flagstore::MemoryStoreLogger::error(message, ##__VA_ARGS__)

#define STORE_LOG_DEBUG(message, ...)                                          \
  flagstore::StoreLogger::debug(message, ##__VA_ARGS__)
#define STORE_LOG_INFO(message, ...)                                           \
  flagstore::StoreLogger::info(message, ##__VA_ARGS__)
#define STORE_LOG_WARN(message, ...)                                           \
  flagstore::StoreLogger::warn(message, ##__VA_ARGS__)
#define STORE_LOG_ERROR(message, ...)                                          \
  flagstore::StoreLogger::error(message, ##__VA_ARGS__)

#define PERSIST_LOG_DEBUG(message, ...)                                        \
  flagstore::PersistenceLogger::debug(message, ##__VA_ARGS__)
#define PERSIST_LOG_WARN(message, ...)                                         \
  flagstore::PersistenceLogger::warn(message, ##__VA_ARGS__)
#define PERSIST_LOG_ERROR(message, ...)                                        \
  flagstore::PersistenceLogger::error(message, ##__VA_ARGS__)

#define STATUS_LOG_DEBUG(message, ...)                                         \
  flagstore::StatusLogger::debug(message, ##__VA_ARGS__)
#define STATUS_LOG_ERROR(message, ...)                                         \
  flagstore::StatusLogger::error(message, ##__VA_ARGS__)

#define REDIS_LOG_DEBUG(message, ...)                                          \
  flagstore::RedisLogger::debug(message, ##__VA_ARGS__)
#define REDIS_LOG_INFO(message, ...)                                           \
  flagstore::RedisLogger::info(message, ##__VA_ARGS__)
#define REDIS_LOG_WARN(message, ...)                                           \
  flagstore::RedisLogger::warn(message, ##__VA_ARGS__)
#define REDIS_LOG_ERROR(message, ...)                                          \
  flagstore::RedisLogger::error(message, ##__VA_ARGS__)

#define SOURCE_LOG_INFO(message, ...)                                          \
  flagstore::SourceLogger::info(message, ##__VA_ARGS__)
#define SOURCE_LOG_WARN(message, ...)                                          \
  flagstore::SourceLogger::warn(message, ##__VA_ARGS__)
#define SOURCE_LOG_ERROR(message, ...)                                         \
  flagstore::SourceLogger::error(message, ##__VA_ARGS__)
