#ifndef CACHEINTERFACE_HPP
#define CACHEINTERFACE_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "../codec/ValueCodec.hpp"

// The caller-facing contract, identical for every storage backend.
// Values are anything nlohmann::json can hold; payloads come back as the
// encoded bytes written by ValueCodec.
class CacheInterface {
public:
    virtual ~CacheInterface() = default;

    // Throws AlreadyExistsError when a live entry exists for key.
    virtual void add(const std::string& key, const nlohmann::json& value) = 0;
    // Inserts or overwrites.
    virtual void set(const std::string& key, const nlohmann::json& value) = 0;
    // Throws NotFoundError or ExpiredError.
    virtual std::string get(const std::string& key) = 0;
    // Same as get, and removes the entry on success.
    virtual std::string pull(const std::string& key) = 0;
    virtual bool has(const std::string& key) = 0;
    virtual void remove(const std::string& key) = 0;
    virtual void flush() = 0;

    template <typename T>
    T getAs(const std::string& key) {
        return ValueCodec::decode<T>(get(key));
    }

    template <typename T>
    T pullAs(const std::string& key) {
        return ValueCodec::decode<T>(pull(key));
    }
};

#endif // CACHEINTERFACE_HPP
