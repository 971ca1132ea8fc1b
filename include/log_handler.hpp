#pragma once

#include "type_definitions.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace flagstore {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

enum class LogFormat { TEXT = 0, JSON = 1 };

/**
 * Structure representing a single log entry with all necessary information
 * for processing and formatting by log handlers.
 */
struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level = LogLevel::INFO;
  std::string component;
  std::string message;
  LogContext context;

  LogEntry() = default;

  LogEntry(LogLevel lvl, const std::string &comp, const std::string &msg,
           const LogContext &ctx = {})
      : timestamp(std::chrono::system_clock::now()), level(lvl),
        component(comp), message(msg), context(ctx) {}
};

/**
 * Abstract base class for all log handlers.
 * Defines the interface for polymorphic log output destinations.
 */
class LogHandler {
public:
  virtual ~LogHandler() = default;

  /**
   * Process and output a log entry.
   * @param entry The log entry to handle
   */
  virtual void handle(const LogEntry &entry) = 0;

  /**
   * Get a unique identifier for this handler.
   * @return Handler identifier string
   */
  virtual std::string getId() const = 0;

  /**
   * Determine if this handler should process the given log entry.
   * @param entry The log entry to evaluate
   * @return true if the handler should process this entry
   */
  virtual bool shouldHandle(const LogEntry &entry) const = 0;

  /**
   * Flush any buffered output.
   */
  virtual void flush() {}

  /**
   * Shutdown the handler and clean up resources.
   */
  virtual void shutdown() {}

  static std::string levelToString(LogLevel level);
  static std::string
  formatTimestamp(const std::chrono::system_clock::time_point &timestamp);

protected:
  std::string formatAsText(const LogEntry &entry) const;
  std::string formatAsJson(const LogEntry &entry) const;
};

/**
 * Log handler that outputs to console (stdout/stderr).
 */
class ConsoleLogHandler : public LogHandler {
public:
  /**
   * @param id Unique identifier for this handler
   * @param format Output format (TEXT or JSON)
   * @param errorToStderr Whether to send ERROR and FATAL to stderr
   * @param minLevel Minimum log level to handle
   */
  explicit ConsoleLogHandler(const std::string &id,
                             LogFormat format = LogFormat::TEXT,
                             bool errorToStderr = true,
                             LogLevel minLevel = LogLevel::DEBUG);

  void handle(const LogEntry &entry) override;
  std::string getId() const override { return id_; }
  bool shouldHandle(const LogEntry &entry) const override;
  void flush() override;

private:
  std::string id_;
  LogFormat format_;
  bool errorToStderr_;
  LogLevel minLevel_;
  mutable std::mutex consoleMutex_;

  std::ostream &getOutputStream(LogLevel level) const;
};

/**
 * Log handler that appends to a file, rotating it once it grows past
 * maxFileSize. Rotated files are renamed to <file>.1 .. <file>.N.
 */
class FileLogHandler : public LogHandler {
public:
  FileLogHandler(const std::string &id, const std::string &filename,
                 LogFormat format = LogFormat::TEXT,
                 LogLevel minLevel = LogLevel::DEBUG,
                 size_t maxFileSize = 10 * 1024 * 1024,
                 int maxBackupFiles = 5);

  ~FileLogHandler() override;

  FileLogHandler(const FileLogHandler &) = delete;
  FileLogHandler &operator=(const FileLogHandler &) = delete;

  void handle(const LogEntry &entry) override;
  std::string getId() const override { return id_; }
  bool shouldHandle(const LogEntry &entry) const override;
  void flush() override;
  void shutdown() override;

  bool isOpen() const;
  size_t getFileSize() const;

private:
  std::string id_;
  std::string filename_;
  LogFormat format_;
  LogLevel minLevel_;
  size_t maxFileSize_;
  int maxBackupFiles_;
  std::ofstream fileStream_;
  mutable std::mutex fileMutex_;
  size_t fileSize_ = 0;

  // Caller must hold fileMutex_
  void rotate();
};

} // namespace flagstore
