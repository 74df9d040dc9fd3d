#ifndef CACHECONFIG_HPP
#define CACHECONFIG_HPP

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string CACHE_HIT = "cache.hit";

    static std::string CACHE_MISS = "cache.miss";

    static std::string CACHE_EXPIRED = "cache.expired";

    static std::string CACHE_WRITE = "cache.write";

    static std::string CACHE_ADD_CONFLICT = "cache.add_conflict";

    static std::string SWEEP_PASS = "cache.sweep";

    static std::string SWEEP_DURATION = "cache.sweep.duration";
}

// The storage tier behind a cache instance. Fixed for the instance's lifetime.
enum class BackendKind {
    Memory,
    File,
    Redis,
    RedisCluster
};

inline std::string backendKindName(BackendKind kind) {
    switch (kind) {
        case BackendKind::Memory: return "memory";
        case BackendKind::File: return "file";
        case BackendKind::Redis: return "redis";
        case BackendKind::RedisCluster: return "redis-cluster";
    }
    return "unknown";
}

struct RedisEndpoint {
    std::string host;
    int port;
};

// --- Configuration Struct ---
class CacheConfig {
public:
    BackendKind backend;

    // Expiration. Zero or negative means entries never expire.
    long long ttl_in_millis;

    // File backend
    std::string file_cache_dir;

    // Redis backend
    std::string redis_host;
    int redis_port;
    std::string redis_password;
    std::vector<RedisEndpoint> redis_nodes; // Used by the redis-cluster backend
    int redis_connect_timeout_in_millis;

    // Expiry sweeper
    int sweeper_threads;

    // Logging Level
    LogUtils::LogLevel log_level;

    CacheConfig() {
        // --- Set Defaults  ---
        backend = BackendKind::Memory;
        ttl_in_millis = 0;
        file_cache_dir = "/tmp/cachefacade";
        redis_host = "localhost";
        redis_port = 6379;
        redis_connect_timeout_in_millis = 1000;
        sweeper_threads = 2;
        log_level = LogUtils::LogLevel::CERROR; // Default log level
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "backend: " << backendKindName(backend) << std::endl
            << "ttl_in_millis: " << ttl_in_millis << std::endl
            << "file_cache_dir: " << file_cache_dir << std::endl
            << "// --- Redis Configuration --- //" << std::endl
            << "redis_host: " << redis_host << std::endl
            << "redis_port: " << redis_port << std::endl
            << "redis_password: " << (redis_password.empty() ? "<none>" : "<set>") << std::endl
            << "redis_connect_timeout_in_millis: " << redis_connect_timeout_in_millis << std::endl
            << "// --- Sweeper & Logging --- //" << std::endl
            << "sweeper_threads: " << sweeper_threads << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl;

        ss << "--- Redis cluster nodes ---" << std::endl;
        for (const auto& node : redis_nodes) {
            ss << node.host << ":" << node.port << std::endl;
        }
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // CACHECONFIG_HPP
