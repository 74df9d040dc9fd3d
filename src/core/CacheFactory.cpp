#include "CacheFactory.hpp"

#include <stdexcept>

#include "../cache/FileStore.hpp"
#include "../cache/MemoryStore.hpp"
#include "../cache/RedisStore.hpp"
#include "../metrics/DummyStatsDClient.hpp"

namespace {

std::shared_ptr<IStatsDClient> orDummy(std::shared_ptr<IStatsDClient> statsd_client) {
    if (statsd_client) {
        return statsd_client;
    }
    return DummyStatsDClient::getInstance();
}

} // namespace

std::shared_ptr<Cache> CacheFactory::newMemoryCache(
    std::chrono::milliseconds ttl,
    std::shared_ptr<ILogger> logger,
    std::shared_ptr<IStatsDClient> statsd_client) {
    ExpirationPolicy policy(ttl);
    return std::make_shared<Cache>(std::make_unique<MemoryStore>(policy), policy, logger, orDummy(statsd_client));
}

std::shared_ptr<Cache> CacheFactory::newFileCache(
    std::chrono::milliseconds ttl,
    const std::string& directory,
    std::shared_ptr<ILogger> logger,
    std::shared_ptr<IStatsDClient> statsd_client,
    size_t sweeper_threads) {
    ExpirationPolicy policy(ttl);
    return std::make_shared<Cache>(
        std::make_unique<FileStore>(policy, directory, logger), policy, logger, orDummy(statsd_client), sweeper_threads);
}

std::shared_ptr<Cache> CacheFactory::newRedisCache(
    std::chrono::milliseconds ttl,
    const RedisEndpoint& endpoint,
    const std::string& password,
    std::shared_ptr<ILogger> logger,
    std::shared_ptr<IStatsDClient> statsd_client,
    int connect_timeout_in_millis) {
    ExpirationPolicy policy(ttl);
    return std::make_shared<Cache>(
        std::make_unique<RedisStore>(policy, endpoint, password, connect_timeout_in_millis, logger),
        policy, logger, orDummy(statsd_client));
}

std::shared_ptr<Cache> CacheFactory::newRedisClusterCache(
    std::chrono::milliseconds ttl,
    const std::vector<RedisEndpoint>& nodes,
    const std::string& password,
    std::shared_ptr<ILogger> logger,
    std::shared_ptr<IStatsDClient> statsd_client,
    int connect_timeout_in_millis) {
    ExpirationPolicy policy(ttl);
    return std::make_shared<Cache>(
        std::make_unique<RedisStore>(policy, nodes, password, connect_timeout_in_millis, logger),
        policy, logger, orDummy(statsd_client));
}

std::shared_ptr<Cache> CacheFactory::create(
    const CacheConfig& config,
    std::shared_ptr<ILogger> logger,
    std::shared_ptr<IStatsDClient> statsd_client) {
    std::chrono::milliseconds ttl(config.ttl_in_millis);

    switch (config.backend) {
        case BackendKind::Memory:
            return newMemoryCache(ttl, logger, statsd_client);
        case BackendKind::File:
            return newFileCache(ttl, config.file_cache_dir, logger, statsd_client,
                                static_cast<size_t>(config.sweeper_threads));
        case BackendKind::Redis:
            return newRedisCache(ttl, RedisEndpoint{config.redis_host, config.redis_port}, config.redis_password,
                                 logger, statsd_client, config.redis_connect_timeout_in_millis);
        case BackendKind::RedisCluster:
            if (config.redis_nodes.empty()) {
                throw std::invalid_argument("redis-cluster backend requires redis_nodes");
            }
            return newRedisClusterCache(ttl, config.redis_nodes, config.redis_password,
                                        logger, statsd_client, config.redis_connect_timeout_in_millis);
    }
    throw std::invalid_argument("Unknown cache backend");
}
