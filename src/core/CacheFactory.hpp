#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "Cache.hpp"
#include "../config/CacheConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// One constructor per backend kind. TTL is always required; zero or less
// means entries never expire. statsd_client may be null (metrics discarded).
class CacheFactory {
public:
    static std::shared_ptr<Cache> newMemoryCache(
        std::chrono::milliseconds ttl,
        std::shared_ptr<ILogger> logger,
        std::shared_ptr<IStatsDClient> statsd_client = nullptr);

    static std::shared_ptr<Cache> newFileCache(
        std::chrono::milliseconds ttl,
        const std::string& directory,
        std::shared_ptr<ILogger> logger,
        std::shared_ptr<IStatsDClient> statsd_client = nullptr,
        size_t sweeper_threads = 2);

    // Throws ConnectionError if the server does not answer AUTH/PING.
    static std::shared_ptr<Cache> newRedisCache(
        std::chrono::milliseconds ttl,
        const RedisEndpoint& endpoint,
        const std::string& password,
        std::shared_ptr<ILogger> logger,
        std::shared_ptr<IStatsDClient> statsd_client = nullptr,
        int connect_timeout_in_millis = 1000);

    // Throws ConnectionError if any node does not answer AUTH/PING.
    static std::shared_ptr<Cache> newRedisClusterCache(
        std::chrono::milliseconds ttl,
        const std::vector<RedisEndpoint>& nodes,
        const std::string& password,
        std::shared_ptr<ILogger> logger,
        std::shared_ptr<IStatsDClient> statsd_client = nullptr,
        int connect_timeout_in_millis = 1000);

    // Builds the cache described by config.backend.
    static std::shared_ptr<Cache> create(
        const CacheConfig& config,
        std::shared_ptr<ILogger> logger,
        std::shared_ptr<IStatsDClient> statsd_client = nullptr);
};
