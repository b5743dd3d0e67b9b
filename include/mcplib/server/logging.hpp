#pragma once
#include <functional>
#include <iostream>
#include <string>
#include <utility>

namespace mcplib::server
{

using LogCallback = std::function<void(const std::string&)>;

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error
};

inline const char* to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

/// Unknown names fall back to INFO.
inline LogLevel log_level_from_string(const std::string& s)
{
    if (s == "DEBUG")
        return LogLevel::Debug;
    if (s == "WARN" || s == "WARNING")
        return LogLevel::Warn;
    if (s == "ERROR")
        return LogLevel::Error;
    return LogLevel::Info;
}

/// Sink for I/O traces and diagnostics.
///
/// Trace lines ("-> request", "<- response") bypass the level filter; they are
/// gated by the caller's log_io switch instead.
class Logger
{
  public:
    explicit Logger(LogCallback callback = nullptr, LogLevel min_level = LogLevel::Info)
        : callback_(std::move(callback)), min_level_(min_level)
    {
        if (!callback_)
        {
            callback_ = [](const std::string& msg)
            {
                // Default: print to stderr, stdout belongs to the transport
                std::cerr << "[MCP] " << msg << std::endl;
            };
        }
    }

    void log(LogLevel level, const std::string& msg) const
    {
        if (level < min_level_)
            return;
        callback_(std::string(to_string(level)) + " " + msg);
    }

    void inbound(const std::string& raw) const
    {
        callback_("-> " + raw);
    }
    void outbound(const std::string& raw) const
    {
        callback_("<- " + raw);
    }

    LogLevel min_level() const
    {
        return min_level_;
    }
    void set_min_level(LogLevel level)
    {
        min_level_ = level;
    }

  private:
    LogCallback callback_;
    LogLevel min_level_;
};

} // namespace mcplib::server
