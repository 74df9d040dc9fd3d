#pragma once

#include <chrono>
#include <string>

// Counter/timer sink for cache activity. Keys come from MetricsDefinitions.
class IStatsDClient {
public:
    virtual ~IStatsDClient() = default;

    virtual void increment(const std::string& key, int value = 1) = 0;
    virtual void timing(const std::string& key, std::chrono::milliseconds value) = 0;
};
