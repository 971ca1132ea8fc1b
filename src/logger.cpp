#include "logger.hpp"
#include <algorithm>
#include <iostream>

namespace flagstore {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    replaceBuiltInHandlers(config_);
}

Logger::~Logger() {
    shutdown();
}

void Logger::configure(const LogConfig& config) {
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = config;
    }

    replaceBuiltInHandlers(config);

    if (config.asyncLogging) {
        startAsyncWorker();
    } else {
        stopAsyncWorker();
    }
}

LogConfig Logger::getConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.level = level;
}

void Logger::setComponentFilter(const StringSet& components) {
    std::lock_guard<std::mutex> lock(configMutex_);
    config_.componentFilter = components;
}

void Logger::enableAsyncLogging(bool enable) {
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_.asyncLogging = enable;
    }
    if (enable) {
        startAsyncWorker();
    } else {
        stopAsyncWorker();
    }
}

Logger::HandlerResult Logger::registerHandler(std::shared_ptr<LogHandler> handler) {
    if (!handler) {
        return HandlerResult::INVALID_HANDLER;
    }

    std::lock_guard<std::mutex> lock(handlersMutex_);
    auto id = handler->getId();
    auto existing = std::find_if(handlers_.begin(), handlers_.end(),
        [&id](const auto& h) { return h->getId() == id; });
    if (existing != handlers_.end()) {
        return HandlerResult::ALREADY_EXISTS;
    }
    handlers_.push_back(std::move(handler));
    return HandlerResult::SUCCESS;
}

bool Logger::unregisterHandler(const std::string& handlerId) {
    std::shared_ptr<LogHandler> removed;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = std::find_if(handlers_.begin(), handlers_.end(),
            [&handlerId](const auto& h) { return h->getId() == handlerId; });
        if (it == handlers_.end()) {
            return false;
        }
        removed = *it;
        handlers_.erase(it);
    }
    removed->flush();
    return true;
}

bool Logger::hasHandler(const std::string& handlerId) const {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    return std::any_of(handlers_.begin(), handlers_.end(),
        [&handlerId](const auto& h) { return h->getId() == handlerId; });
}

size_t Logger::getHandlerCount() const {
    std::lock_guard<std::mutex> lock(handlersMutex_);
    return handlers_.size();
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const LogContext& context) {
    if (!isEnabled(level, component)) {
        return;
    }

    metrics_.totalMessages++;
    if (level == LogLevel::ERROR || level == LogLevel::FATAL) {
        metrics_.errorCount++;
    } else if (level == LogLevel::WARN) {
        metrics_.warningCount++;
    }

    LogEntry entry(level, component, message, context);
    if (asyncStarted_) {
        enqueue(std::move(entry));
    } else {
        dispatch(entry);
    }
}

void Logger::debug(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::DEBUG, component, message, context);
}

void Logger::info(const std::string& component, const std::string& message,
                  const LogContext& context) {
    log(LogLevel::INFO, component, message, context);
}

void Logger::warn(const std::string& component, const std::string& message,
                  const LogContext& context) {
    log(LogLevel::WARN, component, message, context);
}

void Logger::error(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::ERROR, component, message, context);
}

void Logger::fatal(const std::string& component, const std::string& message,
                   const LogContext& context) {
    log(LogLevel::FATAL, component, message, context);
}

bool Logger::isEnabled(LogLevel level, const std::string& component) const {
    std::lock_guard<std::mutex> lock(configMutex_);
    if (level < config_.level) {
        return false;
    }
    if (!config_.componentFilter.empty() &&
        config_.componentFilter.find(component) == config_.componentFilter.end()) {
        return false;
    }
    return true;
}

LogMetrics Logger::getMetrics() const {
    return metrics_;
}

void Logger::resetMetrics() {
    metrics_ = LogMetrics{};
}

void Logger::flush() {
    if (asyncStarted_) {
        std::unique_lock<std::mutex> lock(asyncMutex_);
        drainedCondition_.wait(lock, [this] { return entryQueue_.empty(); });
    }

    std::vector<std::shared_ptr<LogHandler>> snapshot;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        snapshot = handlers_;
    }
    for (const auto& handler : snapshot) {
        handler->flush();
    }
}

void Logger::shutdown() {
    stopAsyncWorker();

    std::lock_guard<std::mutex> lock(handlersMutex_);
    for (const auto& handler : handlers_) {
        handler->flush();
    }
}

void Logger::dispatch(const LogEntry& entry) {
    std::vector<std::shared_ptr<LogHandler>> snapshot;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        snapshot = handlers_;
    }

    for (const auto& handler : snapshot) {
        if (!handler->shouldHandle(entry)) {
            continue;
        }
        try {
            handler->handle(entry);
        } catch (const std::exception& e) {
            metrics_.droppedMessages++;
            std::cerr << "Log handler '" << handler->getId() << "' failed: " << e.what() << std::endl;
        }
    }
}

void Logger::enqueue(LogEntry entry) {
    size_t maxQueueSize;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        maxQueueSize = config_.maxQueueSize;
    }

    std::lock_guard<std::mutex> lock(asyncMutex_);
    if (entryQueue_.size() >= maxQueueSize) {
        metrics_.droppedMessages++;
        return;
    }
    entryQueue_.push(std::move(entry));
    asyncCondition_.notify_one();
}

void Logger::asyncWorker() {
    std::unique_lock<std::mutex> lock(asyncMutex_);
    while (true) {
        asyncCondition_.wait(lock, [this] { return stopAsync_ || !entryQueue_.empty(); });

        while (!entryQueue_.empty()) {
            LogEntry entry = std::move(entryQueue_.front());
            entryQueue_.pop();
            lock.unlock();
            dispatch(entry);
            lock.lock();
        }
        drainedCondition_.notify_all();

        if (stopAsync_) {
            break;
        }
    }
}

void Logger::startAsyncWorker() {
    if (asyncStarted_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(asyncMutex_);
        stopAsync_ = false;
    }
    asyncThread_ = std::thread(&Logger::asyncWorker, this);
}

void Logger::stopAsyncWorker() {
    if (!asyncStarted_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(asyncMutex_);
        stopAsync_ = true;
    }
    asyncCondition_.notify_all();
    if (asyncThread_.joinable()) {
        asyncThread_.join();
    }
    asyncStarted_ = false;

    // Entries queued after the worker drained for the last time
    std::queue<LogEntry> leftovers;
    {
        std::lock_guard<std::mutex> lock(asyncMutex_);
        std::swap(leftovers, entryQueue_);
    }
    while (!leftovers.empty()) {
        dispatch(leftovers.front());
        leftovers.pop();
    }
}

void Logger::replaceBuiltInHandlers(const LogConfig& config) {
    unregisterHandler(CONSOLE_HANDLER_ID);
    unregisterHandler(FILE_HANDLER_ID);

    if (config.consoleOutput) {
        registerHandler(std::make_shared<ConsoleLogHandler>(CONSOLE_HANDLER_ID, config.format));
    }
    if (config.fileOutput) {
        registerHandler(std::make_shared<FileLogHandler>(
            FILE_HANDLER_ID, config.logFile, config.format, LogLevel::DEBUG,
            config.enableRotation ? config.maxFileSize : 0, config.maxBackupFiles));
    }
}

} // namespace flagstore
