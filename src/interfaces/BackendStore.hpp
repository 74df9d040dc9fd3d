#ifndef BACKENDSTORE_HPP
#define BACKENDSTORE_HPP

#include <optional>
#include <string>
#include <vector>

#include "../config/CacheConfig.hpp"
#include "../models/CacheEntry.hpp"

// One storage medium behind a Cache. The Cache serializes writers with its own
// lock but lets readers evict concurrently, so implementations guard their
// internal structures and treat removal of an absent key as a no-op.
class BackendStore {
public:
    virtual ~BackendStore() = default;

    virtual BackendKind kind() const = 0;

    // True when the medium drops expired entries by itself (no local staleness check).
    virtual bool expiresNatively() const = 0;

    // nullopt if the key is absent.
    virtual std::optional<EntryStamp> stat(const std::string& key) = 0;
    virtual std::optional<StoredEntry> read(const std::string& key) = 0;
    virtual void write(const std::string& key, const std::string& payload) = 0;
    virtual void remove(const std::string& key) = 0;
    virtual void flush() = 0;

    // Keys written through this store, for the expiry sweeper.
    virtual std::vector<std::string> keys() = 0;
};

#endif // BACKENDSTORE_HPP
