#ifndef CACHEERRORS_HPP
#define CACHEERRORS_HPP

#include <stdexcept>
#include <string>

// Root of every error raised by the cache facade and its stores.
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& message) : std::runtime_error(message) {}
};

// Key was never cached (or has been removed).
class NotFoundError : public CacheError {
public:
    explicit NotFoundError(const std::string& key)
        : CacheError("cache not found: " + key), key_(key) {}
    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// Key is present in the backend but past its expiry.
class ExpiredError : public CacheError {
public:
    explicit ExpiredError(const std::string& key)
        : CacheError("cache expired: " + key), key_(key) {}
    const std::string& key() const { return key_; }

private:
    std::string key_;
};

class AlreadyExistsError : public CacheError {
public:
    explicit AlreadyExistsError(const std::string& key)
        : CacheError("cache already exists: " + key), key_(key) {}
    const std::string& key() const { return key_; }

private:
    std::string key_;
};

class EncodingError : public CacheError {
public:
    explicit EncodingError(const std::string& message) : CacheError("encoding error: " + message) {}
};

class DecodingError : public CacheError {
public:
    explicit DecodingError(const std::string& message) : CacheError("decoding error: " + message) {}
};

// Remote store unreachable, or a command failed at the transport level.
class ConnectionError : public CacheError {
public:
    explicit ConnectionError(const std::string& message) : CacheError("connection error: " + message) {}
};

// File creation/permission failure in the file backend.
class IOError : public CacheError {
public:
    explicit IOError(const std::string& message) : CacheError("io error: " + message) {}
};

#endif // CACHEERRORS_HPP
