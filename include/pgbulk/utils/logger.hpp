#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace PgBulk {

/**
 * @brief Leveled logging interface handed to every component that reports progress.
 */
class Logger {
public:
    enum class Level {
        Info,
        Step,
        Success,
        Warning,
        Error,
        Bulk
    };

    virtual ~Logger() = default;

    virtual void log(Level level, const std::string& message) = 0;

    void info(const std::string& msg)    { log(Level::Info, msg); }
    void step(const std::string& msg)    { log(Level::Step, msg); }
    void success(const std::string& msg) { log(Level::Success, msg); }
    void warn(const std::string& msg)    { log(Level::Warning, msg); }
    void error(const std::string& msg)   { log(Level::Error, msg); }
    void bulk(const std::string& msg)    { log(Level::Bulk, msg); }
};

/**
 * @brief Thread-safe coloured console logger: "[module] timestamp message".
 */
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(std::string module = "pgbulk") : module_(std::move(module)) {}

    void log(Level level, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
            case Level::Bulk:    color = "\033[0;35m"; prefix = "[BULK] "; break; // Magenta
        }

        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);

        std::cout << color << "[" << module_ << "] "
                  << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << " "
                  << prefix << message << "\033[0m" << std::endl;
    }

private:
    std::string module_;
    std::mutex mutex_;
};

/**
 * @brief Discards everything. Used for quiet jobs.
 */
class NullLogger : public Logger {
public:
    void log(Level, const std::string&) override {}
};

inline std::shared_ptr<Logger> make_logger(bool quiet, const std::string& module = "pgbulk") {
    if (quiet) return std::make_shared<NullLogger>();
    return std::make_shared<ConsoleLogger>(module);
}

} // namespace PgBulk
