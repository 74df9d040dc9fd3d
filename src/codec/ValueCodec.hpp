#ifndef VALUECODEC_HPP
#define VALUECODEC_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "../models/CacheErrors.hpp"

using json = nlohmann::json;

// JSON encoding shared by every backend. Payloads are indented with a single
// space, so files written by the file backend stay human-readable.
class ValueCodec {
public:
    static std::string encode(const json& value) {
        try {
            return value.dump(1, ' ');
        } catch (const json::exception& e) {
            // e.g. type_error 316 on strings that are not valid UTF-8
            throw EncodingError(e.what());
        }
    }

    template <typename T>
    static T decode(const std::string& payload) {
        try {
            return json::parse(payload).get<T>();
        } catch (const json::exception& e) {
            throw DecodingError(e.what());
        }
    }
};

#endif // VALUECODEC_HPP
