#pragma once

#include <cstdarg>
#include <functional>
#include <mutex>
#include <string>

enum class LogLevel
{
    Error,
    Warn,
    Info,
    Verbose,
    Debug
};

// Process-wide diagnostic logger. Everything goes to stderr, the same stream
// the progress bar repaints, so Info and below stay quiet unless asked for.
class Logger
{
public:
    using Sink = std::function<void(LogLevel, const std::string &)>;

    static Logger &instance();

    void setVerbose(bool enabled);
    void setDebug(bool enabled);

    bool verboseEnabled() const;
    bool debugEnabled() const;

    // Receives every emitted line (without prefix) in addition to stderr.
    // Pass nullptr to clear. Intended for tests.
    void setSink(Sink sink);

    void log(LogLevel level, const char *fmt, ...) noexcept;

private:
    Logger() = default;
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    bool shouldLog(LogLevel level) const;
    const char *prefix(LogLevel level) const;

    mutable std::mutex m_mutex;
    bool m_verbose = false;
    bool m_debug = false;
    Sink m_sink;
};

#define LOG_ERROR(...) Logger::instance().log(LogLevel::Error, __VA_ARGS__)
#define LOG_WARN(...) Logger::instance().log(LogLevel::Warn, __VA_ARGS__)
#define LOG_INFO(...) Logger::instance().log(LogLevel::Info, __VA_ARGS__)
#define LOG_VERBOSE(...) Logger::instance().log(LogLevel::Verbose, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::instance().log(LogLevel::Debug, __VA_ARGS__)
