#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace clinscribe {
namespace utils {

bool Logger::initialized_ = false;
LogLevel Logger::level_ = LogLevel::INFO;
std::mutex Logger::mutex_;

void Logger::initialize(LogLevel level) {
    setLevel(level);
    if (!initialized_) {
        initialized_ = true;
        debug("Logger initialized at level " + levelToString(level));
    }
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::getLevel() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

LogLevel Logger::parseLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

void Logger::info(const std::string& message) {
    write(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    write(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    write(LogLevel::ERROR, message);
}

void Logger::debug(const std::string& message) {
    write(LogLevel::DEBUG, message);
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(level_)) {
        return;
    }

    std::ostream& out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
    out << "[" << levelToString(level) << "] " << message << std::endl;
}

} // namespace utils
} // namespace clinscribe
