#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../config/CacheConfig.hpp"
#include "../core/ExpirationPolicy.hpp"
#include "../interfaces/BackendStore.hpp"

// Forward declarations
struct redisContext;
struct redisReply;
class ILogger;

// Redis-backed store. Expiry is handed to Redis with SET ... PX, so entries
// carry no local expiry. The single-node and distributed variants differ only
// in how many connections are opened; keys are routed to a node by CRC-32.
class RedisStore : public BackendStore {
public:
    // Single node.
    RedisStore(ExpirationPolicy policy,
               const RedisEndpoint& endpoint,
               const std::string& password,
               int connect_timeout_in_millis,
               std::shared_ptr<ILogger> logger);

    // Distributed: one connection per node.
    RedisStore(ExpirationPolicy policy,
               const std::vector<RedisEndpoint>& nodes,
               const std::string& password,
               int connect_timeout_in_millis,
               std::shared_ptr<ILogger> logger);

    ~RedisStore() override;

    BackendKind kind() const override { return kind_; }
    bool expiresNatively() const override { return true; }

    std::optional<EntryStamp> stat(const std::string& key) override;
    std::optional<StoredEntry> read(const std::string& key) override;
    void write(const std::string& key, const std::string& payload) override;
    void remove(const std::string& key) override;
    void flush() override;
    // Redis owns expiry, nothing to sweep.
    std::vector<std::string> keys() override { return {}; }

    size_t nodeCount() const { return nodes_.size(); }
    // Index of the node a key is routed to.
    size_t nodeIndexFor(const std::string& key) const;

private:
    RedisStore(ExpirationPolicy policy,
               const std::vector<RedisEndpoint>& nodes,
               const std::string& password,
               int connect_timeout_in_millis,
               std::shared_ptr<ILogger> logger,
               BackendKind kind);

    struct ReplyDeleter {
        void operator()(redisReply* reply) const;
    };
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

    struct Node {
        RedisEndpoint endpoint;
        redisContext* context = nullptr;
        std::mutex mutex; // hiredis contexts are not thread-safe
    };

    void connect(Node& node, const std::string& password, int connect_timeout_in_millis);
    ReplyPtr execute(Node& node, const std::vector<std::string>& args);
    Node& nodeFor(const std::string& key);

    const ExpirationPolicy policy_;
    const BackendKind kind_;
    std::shared_ptr<ILogger> logger_;
    std::vector<std::unique_ptr<Node>> nodes_;
};
