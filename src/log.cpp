/**
 * @file log.cpp
 * @brief Logger state and formatting
 */

#include "cbt/log.hpp"
#include "cbt/datetime.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>

namespace cbt {

std::atomic<LogLevel> Logger::level_{LogLevel::Info};
std::ostream* Logger::stream_ = &std::cerr;
std::mutex Logger::mutex_;

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "UNKNOWN";
}

void Logger::setLevel(LogLevel level) {
    level_ = level;
}

LogLevel Logger::level() {
    return level_.load();
}

void Logger::setStream(std::ostream& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = &stream;
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    DateTime dt = DateTime::fromTimestamp(static_cast<Timestamp>(ms));

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << dt.year << '-'
        << std::setw(2) << dt.month << '-'
        << std::setw(2) << dt.day << ' '
        << std::setw(2) << dt.hour << ':'
        << std::setw(2) << dt.minute << ':'
        << std::setw(2) << dt.second << '.'
        << std::setw(3) << dt.millisecond;
    return oss.str();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!enabled(level)) return;

    std::string stamp = timestamp();
    std::lock_guard<std::mutex> lock(mutex_);
    (*stream_) << stamp << " [" << logLevelName(level) << "] " << message << std::endl;
}

} // namespace cbt
