#include "log_handler.hpp"
#include <filesystem>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

namespace flagstore {

namespace {
    const char* const RESET = "\033[0m";
    const char* const RED = "\033[31m";
    const char* const YELLOW = "\033[33m";
}

std::string LogHandler::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string LogHandler::formatTimestamp(const std::chrono::system_clock::time_point& timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t);
#else
    localtime_r(&time_t, &tm_buf);
#endif

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string LogHandler::formatAsText(const LogEntry& entry) const {
    std::stringstream ss;
    ss << "[" << formatTimestamp(entry.timestamp) << "] "
       << "[" << std::left << std::setw(5) << levelToString(entry.level) << "] "
       << "[" << entry.component << "] "
       << entry.message;

    if (!entry.context.empty()) {
        ss << " |";
        for (const auto& [key, value] : entry.context) {
            ss << " " << key << "=" << value;
        }
    }
    return ss.str();
}

std::string LogHandler::formatAsJson(const LogEntry& entry) const {
    nlohmann::json out = {
        {"timestamp", formatTimestamp(entry.timestamp)},
        {"level", levelToString(entry.level)},
        {"component", entry.component},
        {"message", entry.message}
    };
    if (!entry.context.empty()) {
        nlohmann::json context = nlohmann::json::object();
        for (const auto& [key, value] : entry.context) {
            context[key] = value;
        }
        out["context"] = std::move(context);
    }
    // Invalid UTF-8 in a message must not make logging throw
    return out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// ConsoleLogHandler implementation
ConsoleLogHandler::ConsoleLogHandler(const std::string& id, LogFormat format,
                                     bool errorToStderr, LogLevel minLevel)
    : id_(id), format_(format), errorToStderr_(errorToStderr), minLevel_(minLevel) {}

void ConsoleLogHandler::handle(const LogEntry& entry) {
    if (!shouldHandle(entry)) {
        return;
    }

    std::string formatted = format_ == LogFormat::JSON ? formatAsJson(entry) : formatAsText(entry);
    std::lock_guard<std::mutex> lock(consoleMutex_);
    auto& stream = getOutputStream(entry.level);
    if (format_ == LogFormat::TEXT && entry.level >= LogLevel::WARN) {
        stream << (entry.level == LogLevel::WARN ? YELLOW : RED) << formatted << RESET << '\n';
    } else {
        stream << formatted << '\n';
    }
}

bool ConsoleLogHandler::shouldHandle(const LogEntry& entry) const {
    return entry.level >= minLevel_;
}

void ConsoleLogHandler::flush() {
    std::lock_guard<std::mutex> lock(consoleMutex_);
    std::cout.flush();
    std::cerr.flush();
}

std::ostream& ConsoleLogHandler::getOutputStream(LogLevel level) const {
    if (errorToStderr_ && level >= LogLevel::ERROR) {
        return std::cerr;
    }
    return std::cout;
}

// FileLogHandler implementation
FileLogHandler::FileLogHandler(const std::string& id, const std::string& filename,
                               LogFormat format, LogLevel minLevel,
                               size_t maxFileSize, int maxBackupFiles)
    : id_(id), filename_(filename), format_(format), minLevel_(minLevel),
      maxFileSize_(maxFileSize), maxBackupFiles_(maxBackupFiles) {

    std::filesystem::path filePath(filename_);
    if (filePath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
    }

    fileStream_.open(filename_, std::ios::app);
    if (fileStream_.is_open()) {
        fileStream_.seekp(0, std::ios::end);
        fileSize_ = static_cast<size_t>(fileStream_.tellp());
    } else {
        std::cerr << "Failed to open log file: " << filename_ << std::endl;
    }
}

FileLogHandler::~FileLogHandler() {
    shutdown();
}

void FileLogHandler::handle(const LogEntry& entry) {
    if (!shouldHandle(entry)) {
        return;
    }

    std::string formatted = format_ == LogFormat::JSON ? formatAsJson(entry) : formatAsText(entry);

    std::lock_guard<std::mutex> lock(fileMutex_);
    if (!fileStream_.is_open()) {
        return;
    }
    if (maxFileSize_ > 0 && fileSize_ + formatted.size() + 1 > maxFileSize_) {
        rotate();
    }
    fileStream_ << formatted << '\n';
    fileStream_.flush();
    fileSize_ += formatted.size() + 1;
}

bool FileLogHandler::shouldHandle(const LogEntry& entry) const {
    return entry.level >= minLevel_;
}

void FileLogHandler::flush() {
    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.flush();
    }
}

void FileLogHandler::shutdown() {
    std::lock_guard<std::mutex> lock(fileMutex_);
    if (fileStream_.is_open()) {
        fileStream_.close();
    }
}

bool FileLogHandler::isOpen() const {
    std::lock_guard<std::mutex> lock(fileMutex_);
    return fileStream_.is_open();
}

size_t FileLogHandler::getFileSize() const {
    std::lock_guard<std::mutex> lock(fileMutex_);
    return fileSize_;
}

void FileLogHandler::rotate() {
    fileStream_.close();

    std::error_code ec;
    for (int i = maxBackupFiles_ - 1; i >= 1; --i) {
        std::string from = filename_ + "." + std::to_string(i);
        std::string to = filename_ + "." + std::to_string(i + 1);
        if (std::filesystem::exists(from, ec)) {
            std::filesystem::rename(from, to, ec);
        }
    }
    if (maxBackupFiles_ > 0) {
        std::filesystem::rename(filename_, filename_ + ".1", ec);
    } else {
        std::filesystem::remove(filename_, ec);
    }

    fileStream_.open(filename_, std::ios::trunc);
    fileSize_ = 0;
}

} // namespace flagstore
