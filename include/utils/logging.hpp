#pragma once

#include <string>
#include <mutex>

namespace clinscribe {
namespace utils {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static void initialize(LogLevel level = LogLevel::INFO);
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    /**
     * Parse "DEBUG", "INFO", "WARN"/"WARNING" or "ERROR" (case-insensitive).
     * Unknown names fall back to INFO.
     */
    static LogLevel parseLevel(const std::string& name);
    static std::string levelToString(LogLevel level);

    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
    static void debug(const std::string& message);

private:
    static void write(LogLevel level, const std::string& message);

    static bool initialized_;
    static LogLevel level_;
    static std::mutex mutex_;
};

} // namespace utils
} // namespace clinscribe
