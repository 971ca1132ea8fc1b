#pragma once

#include "log_handler.hpp"
#include "type_definitions.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace flagstore {

struct LogConfig {
  LogLevel level = LogLevel::INFO;
  LogFormat format = LogFormat::TEXT;
  bool consoleOutput = true;
  bool fileOutput = false;
  bool asyncLogging = false;
  std::string logFile = "logs/flagstore.log";
  size_t maxFileSize = 10 * 1024 * 1024; // 10MB
  int maxBackupFiles = 5;
  bool enableRotation = true;
  StringSet componentFilter; // Empty = all components
  size_t maxQueueSize = 10000;
};

struct LogMetrics {
  std::atomic<uint64_t> totalMessages{0};
  std::atomic<uint64_t> errorCount{0};
  std::atomic<uint64_t> warningCount{0};
  std::atomic<uint64_t> droppedMessages{0};
  std::chrono::steady_clock::time_point startTime;

  LogMetrics() : startTime(std::chrono::steady_clock::now()) {}

  // Copy constructor - can't copy atomics directly, so copy their values
  LogMetrics(const LogMetrics &other)
      : totalMessages(other.totalMessages.load()),
        errorCount(other.errorCount.load()),
        warningCount(other.warningCount.load()),
        droppedMessages(other.droppedMessages.load()),
        startTime(other.startTime) {}

  LogMetrics &operator=(const LogMetrics &other) {
    if (this != &other) {
      totalMessages.store(other.totalMessages.load());
      errorCount.store(other.errorCount.load());
      warningCount.store(other.warningCount.load());
      droppedMessages.store(other.droppedMessages.load());
      startTime = other.startTime;
    }
    return *this;
  }
};

/**
 * Process-wide logger. Every message becomes a LogEntry that is dispatched to
 * the registered handlers; the console and file handlers are managed through
 * LogConfig, additional ones through registerHandler().
 */
class Logger {
public:
  enum class HandlerResult {
    SUCCESS,
    ALREADY_EXISTS,
    INVALID_HANDLER
  };

  static constexpr const char *CONSOLE_HANDLER_ID = "console";
  static constexpr const char *FILE_HANDLER_ID = "file";

  static Logger &getInstance();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  // Configuration methods
  void configure(const LogConfig &config);
  LogConfig getConfig() const;
  void setLogLevel(LogLevel level);
  void setComponentFilter(const StringSet &components);
  void enableAsyncLogging(bool enable);

  // Handler management
  HandlerResult registerHandler(std::shared_ptr<LogHandler> handler);
  bool unregisterHandler(const std::string &handlerId);
  bool hasHandler(const std::string &handlerId) const;
  size_t getHandlerCount() const;

  // Logging methods
  void log(LogLevel level, const std::string &component,
           const std::string &message, const LogContext &context = {});
  void debug(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void info(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void warn(const std::string &component, const std::string &message,
            const LogContext &context = {});
  void error(const std::string &component, const std::string &message,
             const LogContext &context = {});
  void fatal(const std::string &component, const std::string &message,
             const LogContext &context = {});

  bool isEnabled(LogLevel level, const std::string &component) const;

  LogMetrics getMetrics() const;
  void resetMetrics();

  // Control methods
  void flush();
  void shutdown();

private:
  Logger();
  ~Logger();

  LogConfig config_;
  mutable std::mutex configMutex_;

  std::vector<std::shared_ptr<LogHandler>> handlers_;
  mutable std::mutex handlersMutex_;

  // Async logging
  std::queue<LogEntry> entryQueue_;
  std::thread asyncThread_;
  std::condition_variable asyncCondition_;
  std::condition_variable drainedCondition_;
  std::mutex asyncMutex_;
  bool stopAsync_ = false;
  std::atomic<bool> asyncStarted_{false};

  LogMetrics metrics_;

  void dispatch(const LogEntry &entry);
  void enqueue(LogEntry entry);
  void asyncWorker();
  void startAsyncWorker();
  void stopAsyncWorker();
  void replaceBuiltInHandlers(const LogConfig &config);
};

} // namespace flagstore

#define LOG_DEBUG(component, message, ...)                                     \
  flagstore::Logger::getInstance().debug(component, message, ##__VA_ARGS__)
#define LOG_INFO(component, message, ...)                                      \
  flagstore::Logger::getInstance().info(component, message, ##__VA_ARGS__)
#define LOG_WARN(component, message, ...)                                      \
  flagstore::Logger::getInstance().warn(component, message, ##__VA_ARGS__)
#define LOG_ERROR(component, message, ...)                                     \
  flagstore::Logger::getInstance().error(component, message, ##__VA_ARGS__)
#define LOG_FATAL(component, message, ...)                                     \
  flagstore::Logger::getInstance().fatal(component, message, ##__VA_ARGS__)

#include "component_logger.hpp"
