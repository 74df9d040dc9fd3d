#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/CacheConfig.hpp"

using namespace std;

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    static BackendKind stringToBackendKind(const std::string& backend) {
        if (backend == "memory") return BackendKind::Memory;
        if (backend == "file") return BackendKind::File;
        if (backend == "redis") return BackendKind::Redis;
        if (backend == "redis-cluster") return BackendKind::RedisCluster;
        throw std::invalid_argument("Invalid cache backend: " + backend);
    }

    // Helper to parse integer safely
    static optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    static optional<long long> stringToLongLong(const std::string& str) {
        try {
            size_t pos;
            long long val = std::stoll(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // "host:port" -> endpoint. Port must be 1..65535.
    static optional<RedisEndpoint> parseEndpoint(const std::string& text) {
        std::string endpoint = trim(text);
        size_t colon = endpoint.rfind(':');
        if (colon == string::npos || colon == 0) {
            return std::nullopt;
        }
        auto port = stringToInt(endpoint.substr(colon + 1));
        if (!port || *port <= 0 || *port > 65535) {
            return std::nullopt;
        }
        return RedisEndpoint{endpoint.substr(0, colon), *port};
    }

    // Comma-separated "host:port" list. Fails if any element is malformed.
    static optional<vector<RedisEndpoint>> parseEndpointList(const std::string& text) {
        vector<RedisEndpoint> endpoints;
        std::stringstream ss(text);
        std::string item;
        while (getline(ss, item, ',')) {
            if (trim(item).empty()) {
                continue;
            }
            auto endpoint = parseEndpoint(item);
            if (!endpoint) {
                return std::nullopt;
            }
            endpoints.push_back(*endpoint);
        }
        return endpoints;
    }

    // Function to parse key-value pairs from a string (using optional version)
    static optional<map<string, string>> parseArguments(const vector<string>& args) {
        map<string, string> argMap;
        for (const string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) { // Ensure key is not empty
                string key = arg.substr(0, delimiterPos);
                string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << endl;
                return nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    // Applies one configuration entry. Returns false for keys that are not
    // configuration (e.g. CLI operation arguments). Throws std::invalid_argument
    // for a known key with a malformed value.
    static bool applyConfigValue(CacheConfig& config, const string& key, const string& value) {
        if (key == "backend") {
            config.backend = stringToBackendKind(value);
        } else if (key == "ttl_in_millis") {
            auto val = stringToLongLong(value);
            if (!val) throw std::invalid_argument("Invalid integer for ttl_in_millis: " + value);
            config.ttl_in_millis = *val;
        } else if (key == "ttl_in_seconds") {
            auto val = stringToLongLong(value);
            if (!val) throw std::invalid_argument("Invalid integer for ttl_in_seconds: " + value);
            if (*val > std::numeric_limits<long long>::max() / 1000 ||
                *val < std::numeric_limits<long long>::min() / 1000) {
                throw std::invalid_argument("ttl_in_seconds out of range: " + value);
            }
            config.ttl_in_millis = (*val) * 1000;
        } else if (key == "file_cache_dir") {
            config.file_cache_dir = value;
        } else if (key == "redis_host") {
            config.redis_host = value;
        } else if (key == "redis_port") {
            auto val = stringToInt(value);
            if (!val || *val <= 0 || *val > 65535) throw std::invalid_argument("Invalid redis_port: " + value);
            config.redis_port = *val;
        } else if (key == "redis_password") {
            config.redis_password = value;
        } else if (key == "redis_nodes") {
            auto nodes = parseEndpointList(value);
            if (!nodes) throw std::invalid_argument("Invalid redis_nodes, expected host:port[,host:port...]: " + value);
            config.redis_nodes = *nodes;
        } else if (key == "redis_connect_timeout_in_millis") {
            auto val = stringToInt(value);
            if (!val || *val <= 0) throw std::invalid_argument("Invalid redis_connect_timeout_in_millis: " + value);
            config.redis_connect_timeout_in_millis = *val;
        } else if (key == "sweeper_threads") {
            auto val = stringToInt(value);
            if (!val || *val <= 0) throw std::invalid_argument("Invalid sweeper_threads: " + value);
            config.sweeper_threads = *val;
        } else if (key == "log_level") {
            config.log_level = stringToLogLevel(value);
        } else {
            return false;
        }
        return true;
    }

    // Reads key=value lines ('#' starts a comment) into config.
    static void readConfigStream(std::istream& in, CacheConfig& config) {
        std::string line;
        while (getline(in, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                continue;
            }
            size_t delimiterPos = line.find('=');
            if (delimiterPos == string::npos || delimiterPos == 0) {
                cerr << "Warning: Ignoring malformed config line: " << line << endl;
                continue;
            }
            string key = trim(line.substr(0, delimiterPos));
            string value = trim(line.substr(delimiterPos + 1));
            if (!applyConfigValue(config, key, value)) {
                cerr << "Warning: Unknown config key: " << key << endl;
            }
        }
    }

    // Defaults, then the first config file found, then command-line arguments.
    static CacheConfig loadConfiguration(
        const map<string, string>& startupArguments,
        const vector<string>& config_paths = {
            "cachefacade.config",             // Current directory
            "../cachefacade.config",          // Parent directory
            "/etc/cachefacade/cachefacade.config"
        }) {
        CacheConfig config;

        // An explicit config= argument replaces the search list.
        vector<string> search_paths = config_paths;
        auto explicit_path = startupArguments.find("config");
        if (explicit_path != startupArguments.end()) {
            search_paths = {explicit_path->second};
        }

        bool config_found = false;
        for (const auto& config_path : search_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                cout << "Reading configuration from " << config_path << "..." << endl;
                readConfigStream(configFile, config);
                config_found = true;
                break;
            }
        }
        if (!config_found) {
            cerr << "Warning: Configuration file not found. Using defaults and command-line arguments." << endl;
        }

        for (const auto& pair : startupArguments) {
            applyConfigValue(config, pair.first, pair.second);
        }
        return config;
    }
};

#endif // UTILS_HPP
