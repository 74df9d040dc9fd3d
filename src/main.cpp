#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/CacheConfig.hpp"
#include "core/Cache.hpp"
#include "core/CacheFactory.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "models/CacheErrors.hpp"
#include "utils/Utils.hpp"

using json = nlohmann::json;
using namespace std;

namespace {

void printUsage() {
    cerr << "Usage: cachefacade_cli op=<add|set|get|pull|has|delete|flush> [key=<key>] [value=<json>]" << endl
         << "                      [backend=memory|file|redis|redis-cluster] [ttl_in_millis=N] [config=<file>]" << endl
         << "                      [file_cache_dir=...] [redis_host=...] [redis_port=...] [redis_password=...]" << endl
         << "                      [redis_nodes=host:port,...] [log_level=DEBUG|INFO|WARNING|CERROR]" << endl;
}

std::string requireArgument(const map<string, string>& args, const string& name) {
    auto it = args.find(name);
    if (it == args.end() || it->second.empty()) {
        throw std::invalid_argument("missing required argument: " + name);
    }
    return it->second;
}

// Runs one cache operation and returns the process exit code.
int runOperation(CacheInterface& cache, const string& op, const map<string, string>& args) {
    if (op == "flush") {
        cache.flush();
        cout << "OK" << endl;
        return 0;
    }

    const std::string key = requireArgument(args, "key");
    if (op == "add" || op == "set") {
        json value;
        try {
            value = json::parse(requireArgument(args, "value"));
        } catch (const json::parse_error& e) {
            throw DecodingError(std::string("value is not valid JSON: ") + e.what());
        }
        if (op == "add") {
            cache.add(key, value);
        } else {
            cache.set(key, value);
        }
        cout << "OK" << endl;
    } else if (op == "get") {
        cout << cache.get(key) << endl;
    } else if (op == "pull") {
        cout << cache.pull(key) << endl;
    } else if (op == "has") {
        bool present = cache.has(key);
        cout << std::boolalpha << present << endl;
        return present ? 0 : 2;
    } else if (op == "delete") {
        cache.remove(key);
        cout << "OK" << endl;
    } else {
        throw std::invalid_argument("unknown op: " + op);
    }
    return 0;
}

} // namespace

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        vector<string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt || parsedArgsOpt->find("op") == parsedArgsOpt->end()) {
            printUsage();
            return 1;
        }
        map<string, string> startupArguments = parsedArgsOpt.value();

        CacheConfig config_ = Utils::loadConfiguration(startupArguments);

        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->debug(config_.to_string());

        std::shared_ptr<Cache> cache = CacheFactory::create(config_, logger_, DummyStatsDClient::getInstance());
        int exit_code = runOperation(*cache, startupArguments.at("op"), startupArguments);

        // Deterministic teardown of the sweeper before exit.
        cache->stopSweeper();
        return exit_code;
    } catch (const CacheError& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(e.what());
        return 1;
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Unhandled exception: " << e.what();
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(ss.str());
        printUsage();
        return 1;
    }
}
