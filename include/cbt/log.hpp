/**
 * @file log.hpp
 * @brief Process-wide level-filtered logger
 *
 * Used by the data, cache and optimisation collaborators. The engine and
 * the strategies never log; they raise.
 *
 * Usage:
 *   Logger::setLevel(LogLevel::Debug);
 *   CBT_LOG_INFO("loaded " << n << " bars from " << path);
 */

#pragma once

#include <atomic>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace cbt {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Off = 4
};

const char* logLevelName(LogLevel level);

/**
 * @brief Static logger writing "YYYY-MM-DD HH:MM:SS.mmm [LEVEL] message"
 *
 * Messages below the current level are discarded before the lock is taken.
 */
class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel level();

    /**
     * @brief Redirect output (std::cerr by default). The stream must outlive
     *        its use by the logger.
     */
    static void setStream(std::ostream& stream);

    static bool enabled(LogLevel lvl) { return lvl != LogLevel::Off && lvl >= level(); }

    static void log(LogLevel level, const std::string& message);

    static void info(const std::string& message) { log(LogLevel::Info, message); }

private:
    static std::string timestamp();

    static std::atomic<LogLevel> level_;
    static std::ostream* stream_;
    static std::mutex mutex_;
};

} // namespace cbt

#define CBT_LOG(lvl, expr)                                  \
    do {                                                    \
        if (::cbt::Logger::enabled(lvl)) {                  \
            std::ostringstream cbt_log_oss_;                \
            cbt_log_oss_ << expr;                           \
            ::cbt::Logger::log(lvl, cbt_log_oss_.str());    \
        }                                                   \
    } while (0)

#define CBT_LOG_DEBUG(expr) CBT_LOG(::cbt::LogLevel::Debug, expr)
#define CBT_LOG_INFO(expr) CBT_LOG(::cbt::LogLevel::Info, expr)
#define CBT_LOG_WARNING(expr) CBT_LOG(::cbt::LogLevel::Warning, expr)
#define CBT_LOG_ERROR(expr) CBT_LOG(::cbt::LogLevel::Error, expr)
