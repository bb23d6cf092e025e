#include "logger.h"

#include <cstdarg>
#include <cstdio>
#include <exception>
#include <vector>

Logger &Logger::instance()
{
    static Logger s_instance;
    return s_instance;
}

void Logger::setVerbose(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_verbose = enabled;
}

void Logger::setDebug(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_debug = enabled;
}

bool Logger::verboseEnabled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_verbose;
}

bool Logger::debugEnabled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_debug;
}

void Logger::setSink(Sink sink)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sink = std::move(sink);
}

bool Logger::shouldLog(LogLevel level) const
{
    switch (level)
    {
    case LogLevel::Error:
        return true;
    case LogLevel::Warn:
        return true;
    case LogLevel::Info:
        return m_verbose || m_debug;
    case LogLevel::Verbose:
        return m_verbose || m_debug;
    case LogLevel::Debug:
        return m_debug;
    default:
        return false;
    }
}

const char *Logger::prefix(LogLevel level) const
{
    switch (level)
    {
    case LogLevel::Error:
        return "[ffpb] [ERROR] ";
    case LogLevel::Warn:
        return "[ffpb] [WARN] ";
    case LogLevel::Info:
        return "[ffpb] [INFO] ";
    case LogLevel::Verbose:
        return "[ffpb] [VERBOSE] ";
    case LogLevel::Debug:
        return "[ffpb] [DEBUG] ";
    default:
        return "[ffpb] ";
    }
}

void Logger::log(LogLevel level, const char *fmt, ...) noexcept
{
    if (!fmt)
        return;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!shouldLog(level))
        return;

    char small[512];
    va_list args;
    va_start(args, fmt);
    va_list args_copy;
    va_copy(args_copy, args);
    int needed = std::vsnprintf(small, sizeof(small), fmt, args);
    va_end(args);

    std::string message;
    if (needed < 0)
    {
        message = fmt;
    }
    else if (static_cast<size_t>(needed) < sizeof(small))
    {
        message.assign(small, static_cast<size_t>(needed));
    }
    else
    {
        std::vector<char> large(static_cast<size_t>(needed) + 1);
        std::vsnprintf(large.data(), large.size(), fmt, args_copy);
        message.assign(large.data(), static_cast<size_t>(needed));
    }
    va_end(args_copy);

    std::fputs(prefix(level), stderr);
    std::fputs(message.c_str(), stderr);
    std::fputc('\n', stderr);
    std::fflush(stderr);

    if (m_sink)
    {
        try
        {
            m_sink(level, message);
        }
        catch (const std::exception &)
        {
            // A failing test sink must not take the logger down with it
        }
    }
}
