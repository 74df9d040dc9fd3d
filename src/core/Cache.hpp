#ifndef CACHE_HPP
#define CACHE_HPP

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "ExpirationPolicy.hpp"
#include "ExpirySweeper.hpp"
#include "../config/CacheConfig.hpp"
#include "../interfaces/BackendStore.hpp"
#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// The caching facade. Owns exactly one BackendStore for its whole lifetime and
// applies the same TTL rules to it whatever the medium.
//
// Locking: add/set/remove/flush hold the lock exclusively, get/pull/has hold
// it shared. get/pull/has may evict a stale entry while holding only the shared
// lock; two readers evicting the same key is harmless because removing an
// absent key is a no-op in every store.
//
// When the store cannot expire entries itself and the TTL is positive, an
// ExpirySweeper re-runs has() on every known key once per TTL interval.
class Cache : public CacheInterface {
public:
    Cache(std::unique_ptr<BackendStore> store,
          ExpirationPolicy policy,
          std::shared_ptr<ILogger> logger,
          std::shared_ptr<IStatsDClient> statsd_client,
          size_t sweeper_threads = 2);
    ~Cache() override;

    void add(const std::string& key, const nlohmann::json& value) override;
    void set(const std::string& key, const nlohmann::json& value) override;
    std::string get(const std::string& key) override;
    std::string pull(const std::string& key) override;
    bool has(const std::string& key) override;
    void remove(const std::string& key) override;
    void flush() override;

    BackendKind backend() const { return store_->kind(); }
    std::chrono::milliseconds ttl() const { return policy_.ttl(); }

    // nullptr when no sweeper runs for this instance.
    const ExpirySweeper* sweeper() const { return sweeper_.get(); }
    void stopSweeper();

private:
    // Caller holds mutex_ (shared or exclusive).
    bool hasLocked(const std::string& key);
    std::string readLocked(const std::string& key, bool remove_after_read);
    void evictStale(const std::string& key);

    std::unique_ptr<BackendStore> store_;
    const ExpirationPolicy policy_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_mutex mutex_;

    // Declared last: destroyed first, while the store is still alive.
    std::unique_ptr<ExpirySweeper> sweeper_;

    Cache(const Cache&) = delete;
    Cache& operator=(const Cache&) = delete;
};

#endif // CACHE_HPP
