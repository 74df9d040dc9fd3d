#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

#include "../config/CacheConfig.hpp"
#include "../interfaces/ILogger.hpp"

class ConsoleLogger : public ILogger {
public:
    // Process-wide logger used by the CLI before and after configuration is loaded.
    // The level passed on the first call wins.
    static std::shared_ptr<ConsoleLogger> getInstance(LogUtils::LogLevel logLevel);

    explicit ConsoleLogger(LogUtils::LogLevel logLevel) : logLevel(logLevel) {}
    ~ConsoleLogger() override = default;

    void info(const std::string& message) override;
    void debug(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;
    void setup(const std::string& message) override;
    int getLogLevel() override { return logLevel; }

private:
    void write(std::ostream& out, const std::string& prefix, const std::string& message);

    LogUtils::LogLevel logLevel;
    std::mutex cout_mutex_; // Serializes writes to std::cout / std::cerr

    static std::shared_ptr<ConsoleLogger> instance;
    static std::once_flag init_flag;

    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;
    ConsoleLogger(ConsoleLogger&&) = delete;
    ConsoleLogger& operator=(ConsoleLogger&&) = delete;
};
