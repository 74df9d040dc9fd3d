#ifndef MEMORYSTORE_HPP
#define MEMORYSTORE_HPP

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../core/ExpirationPolicy.hpp"
#include "../interfaces/BackendStore.hpp"

// In-process map of key -> {payload, expiry}.
class MemoryStore : public BackendStore {
public:
    explicit MemoryStore(ExpirationPolicy policy);
    ~MemoryStore() override = default;

    BackendKind kind() const override { return BackendKind::Memory; }
    bool expiresNatively() const override { return false; }

    std::optional<EntryStamp> stat(const std::string& key) override;
    std::optional<StoredEntry> read(const std::string& key) override;
    void write(const std::string& key, const std::string& payload) override;
    void remove(const std::string& key) override;
    void flush() override;
    std::vector<std::string> keys() override;

    size_t size() const;

private:
    struct CacheEntry {
        std::string payload;
        std::optional<ExpirationPolicy::TimePoint> expires_at; // Empty: never expires
    };

    const ExpirationPolicy policy_;
    std::unordered_map<std::string, CacheEntry> items_;
    mutable std::mutex mutex_;
};

#endif // MEMORYSTORE_HPP
