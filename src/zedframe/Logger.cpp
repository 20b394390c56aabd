#include "zedframe/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

#include "zedframe/Errors.hpp"

namespace zedframe {

std::atomic<LogLevel> Logger::min_level_{LogLevel::Info};

namespace {

const char* levelLabel(LogLevel level) {
    switch (level) {
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

std::string wallClock() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
}

} // namespace

LogLevel parseLogLevel(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lower == "debug") {
        return LogLevel::Debug;
    }
    if (lower == "info") {
        return LogLevel::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "error") {
        return LogLevel::Error;
    }
    throw ConfigurationError("Unknown log level: " + value);
}

void Logger::setMinLevel(LogLevel level) {
    min_level_.store(level);
}

LogLevel Logger::minLevel() {
    return min_level_.load();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(min_level_.load())) {
        return;
    }

    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    auto& out = (level == LogLevel::Warn || level == LogLevel::Error) ? std::cerr : std::cout;
    out << wallClock() << " [" << levelLabel(level) << "] " << message << std::endl;
}

} // namespace zedframe
