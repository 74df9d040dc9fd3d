#ifndef FILESTORE_HPP
#define FILESTORE_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "../core/ExpirationPolicy.hpp"
#include "../interfaces/BackendStore.hpp"
#include "../interfaces/ILogger.hpp"

// One file per key directly under base_dir; the file holds exactly the payload.
// The write instant is the file's modification time, so touching a file from
// outside the cache resets its freshness.
class FileStore : public BackendStore {
public:
    FileStore(ExpirationPolicy policy, std::string base_dir, std::shared_ptr<ILogger> logger);
    ~FileStore() override = default;

    BackendKind kind() const override { return BackendKind::File; }
    bool expiresNatively() const override { return false; }

    std::optional<EntryStamp> stat(const std::string& key) override;
    std::optional<StoredEntry> read(const std::string& key) override;
    void write(const std::string& key, const std::string& payload) override;
    void remove(const std::string& key) override;
    void flush() override;
    std::vector<std::string> keys() override;

    const std::string& baseDir() const { return base_dir_; }

    // Path the key is stored at, or nullopt if the key cannot name a file.
    std::optional<std::string> pathFor(const std::string& key) const;

private:
    void unlink(const std::string& key, const std::string& path);
    void forget(const std::string& key);

    const ExpirationPolicy policy_;
    const std::string base_dir_;
    std::shared_ptr<ILogger> logger_;

    std::unordered_set<std::string> known_files_; // Keys written by this instance
    std::mutex known_files_mutex_;
};

#endif // FILESTORE_HPP
