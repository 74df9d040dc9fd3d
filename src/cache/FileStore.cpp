#include "FileStore.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

#include <sys/stat.h>

#include "../models/CacheErrors.hpp"

namespace {

ExpirationPolicy::TimePoint toTimePoint(const struct timespec& ts) {
    auto since_epoch = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    return ExpirationPolicy::TimePoint(
        std::chrono::duration_cast<ExpirationPolicy::Clock::duration>(since_epoch));
}

} // namespace

FileStore::FileStore(ExpirationPolicy policy, std::string base_dir, std::shared_ptr<ILogger> logger)
    : policy_(policy), base_dir_(std::move(base_dir)), logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for FileStore");
    }
    if (base_dir_.empty()) {
        throw std::invalid_argument("FileStore requires a base directory");
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(base_dir_, ec)) {
        // Writes will fail with IOError until the directory exists.
        logger_->warn("File cache directory does not exist: " + base_dir_);
    }
}

std::optional<std::string> FileStore::pathFor(const std::string& key) const {
    if (key.empty() || key == "." || key == ".." || key.find('/') != std::string::npos) {
        return std::nullopt;
    }
    if (base_dir_.back() == '/') {
        return base_dir_ + key;
    }
    return base_dir_ + "/" + key;
}

std::optional<EntryStamp> FileStore::stat(const std::string& key) {
    auto path = pathFor(key);
    if (!path) {
        return std::nullopt;
    }

    struct stat file_info;
    if (::stat(path->c_str(), &file_info) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            forget(key); // Removed from outside the cache
        }
        return std::nullopt;
    }
    if (!S_ISREG(file_info.st_mode)) {
        forget(key);
        return std::nullopt;
    }
    return EntryStamp{policy_.expiryFor(toTimePoint(file_info.st_mtim))};
}

std::optional<StoredEntry> FileStore::read(const std::string& key) {
    auto stamp = stat(key);
    if (!stamp) {
        return std::nullopt;
    }

    std::ifstream file(*pathFor(key), std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        // Removed between stat and open.
        return std::nullopt;
    }
    std::string payload((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IOError("failed reading cache file for key '" + key + "'");
    }
    return StoredEntry{std::move(payload), stamp->expires_at};
}

void FileStore::write(const std::string& key, const std::string& payload) {
    auto path = pathFor(key);
    if (!path) {
        throw IOError("key '" + key + "' cannot be used as a file name");
    }

    std::ofstream file(*path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw IOError("cannot create file on the given path " + *path + ": " + std::strerror(errno));
    }
    file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    file.close();
    if (file.fail()) {
        throw IOError("failed writing " + *path);
    }

    std::lock_guard<std::mutex> lock(known_files_mutex_);
    known_files_.insert(key);
}

void FileStore::forget(const std::string& key) {
    std::lock_guard<std::mutex> lock(known_files_mutex_);
    known_files_.erase(key);
}

void FileStore::unlink(const std::string& key, const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        logger_->warn("Could not remove cache file " + path + ": " + ec.message());
        return;
    }
    forget(key);
}

void FileStore::remove(const std::string& key) {
    auto path = pathFor(key);
    if (!path) {
        return;
    }
    unlink(key, *path);
}

void FileStore::flush() {
    // Only files this instance wrote; other files in base_dir are left alone.
    for (const auto& key : keys()) {
        unlink(key, *pathFor(key));
    }
}

std::vector<std::string> FileStore::keys() {
    std::lock_guard<std::mutex> lock(known_files_mutex_);
    return std::vector<std::string>(known_files_.begin(), known_files_.end());
}
