#include <chrono>
#include <stdexcept>
#include <string>

#include <sys/time.h>

#include <boost/crc.hpp>
#include <hiredis/hiredis.h>

#include "RedisStore.hpp"
#include "../interfaces/ILogger.hpp"
#include "../models/CacheErrors.hpp"

namespace {

std::string describe(const RedisEndpoint& endpoint) {
    return endpoint.host + ":" + std::to_string(endpoint.port);
}

} // namespace

void RedisStore::ReplyDeleter::operator()(redisReply* reply) const {
    if (reply) {
        freeReplyObject(reply);
    }
}

RedisStore::RedisStore(ExpirationPolicy policy,
                       const RedisEndpoint& endpoint,
                       const std::string& password,
                       int connect_timeout_in_millis,
                       std::shared_ptr<ILogger> logger)
    : RedisStore(policy, std::vector<RedisEndpoint>{endpoint}, password, connect_timeout_in_millis, logger,
                 BackendKind::Redis) {}

RedisStore::RedisStore(ExpirationPolicy policy,
                       const std::vector<RedisEndpoint>& nodes,
                       const std::string& password,
                       int connect_timeout_in_millis,
                       std::shared_ptr<ILogger> logger)
    : RedisStore(policy, nodes, password, connect_timeout_in_millis, logger, BackendKind::RedisCluster) {}

RedisStore::RedisStore(ExpirationPolicy policy,
                       const std::vector<RedisEndpoint>& nodes,
                       const std::string& password,
                       int connect_timeout_in_millis,
                       std::shared_ptr<ILogger> logger,
                       BackendKind kind)
    : policy_(policy), kind_(kind), logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisStore");
    }
    if (nodes.empty()) {
        throw std::invalid_argument("RedisStore requires at least one endpoint");
    }

    for (const auto& endpoint : nodes) {
        auto node = std::make_unique<Node>();
        node->endpoint = endpoint;
        nodes_.push_back(std::move(node));
    }
    // ~RedisStore does not run when the constructor throws.
    try {
        for (auto& node : nodes_) {
            connect(*node, password, connect_timeout_in_millis);
        }
    } catch (...) {
        for (auto& node : nodes_) {
            if (node->context) {
                redisFree(node->context);
                node->context = nullptr;
            }
        }
        throw;
    }
}

RedisStore::~RedisStore() {
    for (auto& node : nodes_) {
        if (node->context) {
            redisFree(node->context);
        }
    }
}

void RedisStore::connect(Node& node, const std::string& password, int connect_timeout_in_millis) {
    struct timeval timeout;
    timeout.tv_sec = connect_timeout_in_millis / 1000;
    timeout.tv_usec = (connect_timeout_in_millis % 1000) * 1000;

    node.context = redisConnectWithTimeout(node.endpoint.host.c_str(), node.endpoint.port, timeout);
    if (node.context == nullptr || node.context->err) {
        std::string error_msg;
        if (node.context) {
            error_msg = "cannot connect to redis server " + describe(node.endpoint) + ": " + node.context->errstr;
            redisFree(node.context);
            node.context = nullptr;
        } else {
            error_msg = "cannot connect to redis server " + describe(node.endpoint) + ": can't allocate redis context";
        }
        logger_->error(error_msg);
        throw ConnectionError(error_msg);
    }

    try {
        if (!password.empty()) {
            execute(node, {"AUTH", password});
        }
        // Reachability probe
        ReplyPtr reply = execute(node, {"PING"});
        if (reply->type != REDIS_REPLY_STATUS) {
            throw ConnectionError("unexpected PING reply from " + describe(node.endpoint));
        }
    } catch (const CacheError& e) {
        logger_->error(std::string("Redis handshake failed: ") + e.what());
        throw ConnectionError("redis server " + describe(node.endpoint) + " rejected handshake: " + e.what());
    }

    logger_->setup("Redis connected at " + describe(node.endpoint));
}

RedisStore::ReplyPtr RedisStore::execute(Node& node, const std::vector<std::string>& args) {
    if (!node.context) {
        throw ConnectionError("redis not connected: " + describe(node.endpoint));
    }

    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    ReplyPtr reply(static_cast<redisReply*>(
        redisCommandArgv(node.context, static_cast<int>(argv.size()), argv.data(), argvlen.data())));
    if (!reply) {
        std::string error_msg = "redis " + args.front() + " failed on " + describe(node.endpoint) + ": " +
                                (node.context->err ? node.context->errstr : "nullptr reply");
        logger_->error(error_msg);
        throw ConnectionError(error_msg);
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        std::string error_msg = "redis " + args.front() + " returned error: " + std::string(reply->str, reply->len);
        logger_->error(error_msg);
        throw CacheError(error_msg);
    }
    return reply;
}

size_t RedisStore::nodeIndexFor(const std::string& key) const {
    if (nodes_.size() == 1) {
        return 0;
    }
    boost::crc_32_type crc;
    crc.process_bytes(key.data(), key.size());
    return crc.checksum() % nodes_.size();
}

RedisStore::Node& RedisStore::nodeFor(const std::string& key) {
    return *nodes_[nodeIndexFor(key)];
}

std::optional<EntryStamp> RedisStore::stat(const std::string& key) {
    Node& node = nodeFor(key);
    std::lock_guard<std::mutex> lock(node.mutex);
    ReplyPtr reply = execute(node, {"EXISTS", key});
    if (reply->type == REDIS_REPLY_INTEGER && reply->integer > 0) {
        return EntryStamp{};
    }
    return std::nullopt;
}

std::optional<StoredEntry> RedisStore::read(const std::string& key) {
    Node& node = nodeFor(key);
    std::lock_guard<std::mutex> lock(node.mutex);
    ReplyPtr reply = execute(node, {"GET", key});
    if (reply->type != REDIS_REPLY_STRING) {
        return std::nullopt; // REDIS_REPLY_NIL
    }
    return StoredEntry{std::string(reply->str, reply->len), std::nullopt};
}

void RedisStore::write(const std::string& key, const std::string& payload) {
    Node& node = nodeFor(key);
    std::lock_guard<std::mutex> lock(node.mutex);
    if (policy_.neverExpires()) {
        execute(node, {"SET", key, payload});
    } else {
        execute(node, {"SET", key, payload, "PX", std::to_string(policy_.ttl().count())});
    }
}

void RedisStore::remove(const std::string& key) {
    Node& node = nodeFor(key);
    std::lock_guard<std::mutex> lock(node.mutex);
    execute(node, {"DEL", key});
}

void RedisStore::flush() {
    for (auto& node : nodes_) {
        std::lock_guard<std::mutex> lock(node->mutex);
        execute(*node, {"FLUSHALL"});
    }
}
