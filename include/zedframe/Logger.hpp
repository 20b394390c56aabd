#pragma once
// Minimal logging utility.

#include <atomic>
#include <string>

namespace zedframe {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Throws ConfigurationError on unknown names.
LogLevel parseLogLevel(const std::string& value);

class Logger {
public:
    static void log(LogLevel level, const std::string& message);
    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();

private:
    static std::atomic<LogLevel> min_level_;
};

} // namespace zedframe
