#pragma once

#include <array>
#include <atomic>
#include <condition_variable>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

enum class LogLevel
{
    DEBUG,
    INFO,
    WARN,
    ERROR
};

constexpr size_t NUM_LOG_LEVELS = static_cast<size_t>(LogLevel::ERROR) + 1;

struct LogEntry
{
    LogLevel level;
    std::string msg;
};

// Set of prefix values to use when we log.
constexpr std::array<std::string_view, NUM_LOG_LEVELS> log_prefix = []
{
    std::array<std::string_view, NUM_LOG_LEVELS> a{};

    a[static_cast<size_t>(LogLevel::DEBUG)] = "[DEBUG]: ";
    a[static_cast<size_t>(LogLevel::INFO)] = "";
    a[static_cast<size_t>(LogLevel::WARN)] = "[WARN]: ";
    a[static_cast<size_t>(LogLevel::ERROR)] = "[ERROR]: ";

    return a;
}();

// Async singleton logger class.
//
// Writes to stderr, stdout belongs to converted text.
class Logger
{
public:
    static constexpr size_t PREALLOCATE_QUEUE_SIZE = 100;

public:
    // Called once in main.
    static void init(LogLevel init_level);

    // Same, but writes to the given stream (must outlive the logger).
    static void init(LogLevel init_level, std::ostream & sink);

    // Called at end of main, drains the queue before returning.
    static void shutdown();

    static bool should_log(LogLevel level)
    {
        return instance().running_ && level >= instance().level_;
    }

    // Messages are dropped while the logger is not running.
    static void log(LogLevel level, std::string msg)
    {
        if (!should_log(level))
        {
            return;
        }

        instance().push_message(level, std::move(msg));
    }

    static void debug(std::string msg)
    {
        log(LogLevel::DEBUG, std::move(msg));
    }

    static void info(std::string msg)
    {
        log(LogLevel::INFO, std::move(msg));
    }

    static void warn(std::string msg)
    {
        log(LogLevel::WARN, std::move(msg));
    }

    static void error(std::string msg)
    {
        log(LogLevel::ERROR, std::move(msg));
    }

private:
    Logger() = default;

    ~Logger();

    // Singleton.
    static Logger & instance();

    void push_message(LogLevel level, std::string msg);

    void worker_loop();

private:
    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::atomic<bool> running_{false};

    std::ostream * sink_{nullptr};

    // Logging is rare next to conversion work, one mutex is enough.
    std::mutex queue_mutex_;
    std::vector<LogEntry> msg_queue_;

    // Prevent thread work when we are not busy.
    std::condition_variable cv_;

    std::jthread worker_;
};
