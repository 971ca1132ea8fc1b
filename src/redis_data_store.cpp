#include "redis_data_store.hpp"

#ifdef FLAGSTORE_ENABLE_REDIS

#include "exceptions.hpp"
#include "logger.hpp"
#include <sstream>
#include <sys/time.h>

namespace flagstore {

namespace {

int64_t versionOf(const nlohmann::json& item) {
    auto it = item.find("version");
    if (it == item.end() || !it->is_number_integer()) {
        return 0;
    }
    return it->get<int64_t>();
}

} // namespace

RedisDataStore::RedisDataStore(const RedisStoreConfig& config)
    : config_(config), context_(nullptr, redisFree) {
    REDIS_LOG_INFO("Redis data store configured with host={}, port={}, db={}, prefix={}", config_.host,
                   config_.port, config_.db, config_.prefix);
}

RedisDataStore::~RedisDataStore() {
    stop();
}

std::string RedisDataStore::itemsKey(DataKind kind) const {
    return config_.prefix + ":" + namespaceName(kind);
}

std::string RedisDataStore::initedKey() const {
    return config_.prefix + ":$inited";
}

void RedisDataStore::ensureConnected() {
    if (context_ && !context_->err) {
        return;
    }
    context_.reset();

    struct timeval timeout = {
        static_cast<time_t>(config_.connectTimeout.count() / 1000),
        static_cast<suseconds_t>((config_.connectTimeout.count() % 1000) * 1000)
    };
    redisContext* rawContext = redisConnectWithTimeout(config_.host.c_str(), config_.port, timeout);
    if (!rawContext || rawContext->err) {
        std::ostringstream message;
        message << "Redis connection failed [host=" << config_.host << ", port=" << config_.port << "]";
        if (rawContext) {
            message << " | redis_err=" << rawContext->err << " | redis_errstr='" << rawContext->errstr << "'";
            redisFree(rawContext);
        } else {
            message << " | reason='cannot allocate redis context'";
        }
        throw SystemException(ErrorCode::NETWORK_ERROR, message.str(), "RedisDataStore");
    }
    context_.reset(rawContext);

    if (!config_.password.empty()) {
        command({"AUTH", config_.password});
    }
    if (config_.db != 0) {
        command({"SELECT", std::to_string(config_.db)});
    }
    REDIS_LOG_DEBUG("Redis connection established");
}

RedisDataStore::ReplyPtr RedisDataStore::command(const std::vector<std::string>& args) {
    ensureConnected();

    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    auto* raw = static_cast<redisReply*>(
        redisCommandArgv(context_.get(), static_cast<int>(args.size()), argv.data(), argvlen.data()));
    if (!raw) {
        std::string error = context_->errstr;
        context_.reset();
        throw SystemException(ErrorCode::NETWORK_ERROR, "Redis command " + args.front() + " failed: " + error,
                              "RedisDataStore");
    }

    ReplyPtr reply(raw, freeReplyObject);
    if (reply->type == REDIS_REPLY_ERROR) {
        throw SystemException(ErrorCode::STORE_OPERATION_FAILED,
                              "Redis command " + args.front() + " error: " + std::string(reply->str, reply->len),
                              "RedisDataStore");
    }
    return reply;
}

void RedisDataStore::discardTransaction() {
    try {
        command({"DISCARD"});
    } catch (const SystemException& e) {
        REDIS_LOG_DEBUG("DISCARD after failed transaction: {}", e.getMessage());
    }
}

void RedisDataStore::unwatch() {
    if (!context_) {
        return;
    }
    try {
        command({"UNWATCH"});
    } catch (const SystemException& e) {
        REDIS_LOG_DEBUG("UNWATCH after aborted update: {}", e.getMessage());
    }
}

void RedisDataStore::init(const SortedCollections& allData) {
    std::lock_guard<std::mutex> lock(mutex_);

    command({"MULTI"});
    try {
        size_t count = 0;
        for (auto kind : ALL_DATA_KINDS) {
            command({"DEL", itemsKey(kind)});
        }
        for (const auto& [kind, items] : allData) {
            for (const auto& [key, item] : items) {
                command({"HSET", itemsKey(kind), key, item.dump()});
                ++count;
            }
        }
        command({"SET", initedKey(), ""});
        auto reply = command({"EXEC"});
        if (reply->type == REDIS_REPLY_NIL) {
            throw SystemException(ErrorCode::STORE_OPERATION_FAILED, "Redis init transaction aborted",
                                  "RedisDataStore");
        }
        REDIS_LOG_INFO("Initialized Redis store with {} items", count);
    } catch (const SystemException&) {
        if (context_) {
            discardTransaction();
        }
        throw;
    }
}

std::optional<nlohmann::json> RedisDataStore::get(DataKind kind, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto reply = command({"HGET", itemsKey(kind), key});
    if (reply->type != REDIS_REPLY_STRING) {
        return std::nullopt;
    }
    return nlohmann::json::parse(std::string(reply->str, reply->len));
}

RawItemMap RedisDataStore::all(DataKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto reply = command({"HGETALL", itemsKey(kind)});
    RawItemMap items;
    if (reply->type != REDIS_REPLY_ARRAY) {
        return items;
    }
    for (size_t i = 0; i + 1 < reply->elements; i += 2) {
        const auto* field = reply->element[i];
        const auto* value = reply->element[i + 1];
        if (field->type != REDIS_REPLY_STRING || value->type != REDIS_REPLY_STRING) {
            continue;
        }
        items.insert_or_assign(std::string(field->str, field->len),
                               nlohmann::json::parse(std::string(value->str, value->len)));
    }
    return items;
}

bool RedisDataStore::upsert(DataKind kind, const nlohmann::json& item) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto key = item.value("key", std::string());
    auto newVersion = versionOf(item);
    auto hashKey = itemsKey(kind);

    for (int attempt = 0; attempt < MAX_UPSERT_ATTEMPTS; ++attempt) {
        command({"WATCH", hashKey});

        int64_t storedVersion = -1;
        try {
            auto existing = command({"HGET", hashKey, key});
            if (existing->type == REDIS_REPLY_STRING) {
                storedVersion = versionOf(nlohmann::json::parse(std::string(existing->str, existing->len)));
            }
        } catch (const std::exception&) {
            unwatch();
            throw;
        }
        if (storedVersion >= newVersion) {
            unwatch();
            REDIS_LOG_DEBUG("Skipping update of {} \"{}\": stored version is not older", objectKindName(kind), key);
            return false;
        }

        command({"MULTI"});
        command({"HSET", hashKey, key, item.dump()});
        auto result = command({"EXEC"});
        if (result->type != REDIS_REPLY_NIL) {
            return true;
        }
        REDIS_LOG_DEBUG("Concurrent modification of {} \"{}\", retrying", objectKindName(kind), key);
    }

    throw SystemException(ErrorCode::STORE_OPERATION_FAILED,
                          "Gave up updating " + key + " after concurrent modifications", "RedisDataStore");
}

bool RedisDataStore::initialized() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto reply = command({"EXISTS", initedKey()});
    return reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

bool RedisDataStore::isAvailable() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        auto reply = command({"PING"});
        return reply->type == REDIS_REPLY_STATUS && std::string(reply->str, reply->len) == "PONG";
    } catch (const SystemException& e) {
        REDIS_LOG_DEBUG("Redis availability check failed: {}", e.getMessage());
        return false;
    }
}

void RedisDataStore::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (context_) {
        context_.reset();
        REDIS_LOG_INFO("Redis connection closed");
    }
}

} // namespace flagstore

#endif // FLAGSTORE_ENABLE_REDIS
