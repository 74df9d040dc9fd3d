#include "Cache.hpp"

#include <mutex>
#include <stdexcept>

#include "../codec/ValueCodec.hpp"
#include "../models/CacheErrors.hpp"

Cache::Cache(std::unique_ptr<BackendStore> store,
             ExpirationPolicy policy,
             std::shared_ptr<ILogger> logger,
             std::shared_ptr<IStatsDClient> statsd_client,
             size_t sweeper_threads)
    : store_(std::move(store)),
      policy_(policy),
      logger_(logger),
      statsd_client_(statsd_client) {
    if (!store_) {
        throw std::invalid_argument("BackendStore cannot be null for Cache");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for Cache");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for Cache");
    }

    if (!store_->expiresNatively() && !policy_.neverExpires()) {
        SweepMode mode = store_->kind() == BackendKind::File ? SweepMode::Concurrent : SweepMode::Sequential;
        sweeper_ = std::make_unique<ExpirySweeper>(
            policy_.ttl(),
            mode,
            [this]() {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                return store_->keys();
            },
            [this](const std::string& key) { return has(key); },
            logger_,
            statsd_client_,
            sweeper_threads);
        sweeper_->start();
    }

    logger_->setup("Cache created: backend=" + backendKindName(store_->kind()) +
                   ", ttl=" + std::to_string(policy_.ttl().count()) + "ms" +
                   (sweeper_ ? ", expiry sweeper armed" : ""));
}

Cache::~Cache() {
    stopSweeper();
}

void Cache::stopSweeper() {
    if (sweeper_) {
        sweeper_->stop();
    }
}

void Cache::evictStale(const std::string& key) {
    store_->remove(key);
    statsd_client_->increment(MetricsDefinitions::CACHE_EXPIRED);
    logger_->debug("Evicted expired cache entry: " + key);
}

bool Cache::hasLocked(const std::string& key) {
    auto stamp = store_->stat(key);
    if (!stamp) {
        return false;
    }
    if (ExpirationPolicy::isStale(stamp->expires_at, ExpirationPolicy::Clock::now())) {
        evictStale(key);
        return false;
    }
    return true;
}

std::string Cache::readLocked(const std::string& key, bool remove_after_read) {
    auto entry = store_->read(key);
    if (!entry) {
        statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
        throw NotFoundError(key);
    }
    if (ExpirationPolicy::isStale(entry->expires_at, ExpirationPolicy::Clock::now())) {
        evictStale(key);
        throw ExpiredError(key);
    }
    if (remove_after_read) {
        store_->remove(key);
    }
    statsd_client_->increment(MetricsDefinitions::CACHE_HIT);
    return std::move(entry->payload);
}

void Cache::add(const std::string& key, const nlohmann::json& value) {
    std::string payload = ValueCodec::encode(value);

    // Check and write under one exclusive hold: two concurrent adds cannot both win.
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (hasLocked(key)) {
        statsd_client_->increment(MetricsDefinitions::CACHE_ADD_CONFLICT);
        throw AlreadyExistsError(key);
    }
    store_->write(key, payload);
    statsd_client_->increment(MetricsDefinitions::CACHE_WRITE);
}

void Cache::set(const std::string& key, const nlohmann::json& value) {
    std::string payload = ValueCodec::encode(value);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    store_->write(key, payload);
    statsd_client_->increment(MetricsDefinitions::CACHE_WRITE);
}

std::string Cache::get(const std::string& key) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return readLocked(key, false);
}

std::string Cache::pull(const std::string& key) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return readLocked(key, true);
}

bool Cache::has(const std::string& key) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    try {
        return hasLocked(key);
    } catch (const std::exception& e) {
        logger_->error("Existence check failed for key '" + key + "': " + e.what());
        return false;
    }
}

void Cache::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    store_->remove(key);
}

void Cache::flush() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    store_->flush();
    logger_->info("Flushed " + backendKindName(store_->kind()) + " cache");
}
