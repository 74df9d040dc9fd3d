#include "MemoryStore.hpp"

MemoryStore::MemoryStore(ExpirationPolicy policy) : policy_(policy) {}

std::optional<EntryStamp> MemoryStore::stat(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return EntryStamp{it->second.expires_at};
}

std::optional<StoredEntry> MemoryStore::read(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = items_.find(key);
    if (it == items_.end()) {
        return std::nullopt;
    }
    return StoredEntry{it->second.payload, it->second.expires_at};
}

void MemoryStore::write(const std::string& key, const std::string& payload) {
    CacheEntry entry;
    entry.payload = payload;
    entry.expires_at = policy_.expiryFor(ExpirationPolicy::Clock::now());

    std::lock_guard<std::mutex> lock(mutex_);
    items_[key] = std::move(entry);
}

void MemoryStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.erase(key);
}

void MemoryStore::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();
}

std::vector<std::string> MemoryStore::keys() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(items_.size());
    for (const auto& item : items_) {
        result.push_back(item.first);
    }
    return result;
}

size_t MemoryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}
