/**
 * @file datetime.hpp
 * @brief Civil date-time helper for bar timestamps
 *
 * Bars carry Timestamp (epoch milliseconds, UTC). DateTime converts between
 * that and the textual forms found in CSV files and on the command line.
 */

#pragma once

#include "cbt/common.hpp"
#include <string>

namespace cbt {

/**
 * @brief DateTime representation (UTC)
 */
struct DateTime {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millisecond = 0;

    DateTime() = default;

    DateTime(int y, int m, int d, int h = 0, int min = 0, int s = 0, int ms = 0)
        : year(y), month(m), day(d), hour(h), minute(min), second(s), millisecond(ms) {}

    /**
     * @brief Epoch milliseconds
     */
    Timestamp toTimestamp() const;

    static DateTime fromTimestamp(Timestamp ts);

    /**
     * @brief Parse "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS[Z]"
     *
     * Throws std::invalid_argument on anything else.
     */
    static DateTime parse(const std::string& str);

    /**
     * @brief "YYYY-MM-DD", with " HH:MM:SS" appended when the time is not midnight
     */
    std::string toString() const;

    bool operator==(const DateTime& o) const {
        return toTimestamp() == o.toTimestamp();
    }
    bool operator<(const DateTime& o) const {
        return toTimestamp() < o.toTimestamp();
    }
};

/**
 * @brief Timestamp from an ISO date / date-time string
 */
inline Timestamp parseTimestamp(const std::string& str) {
    return DateTime::parse(str).toTimestamp();
}

inline std::string formatTimestamp(Timestamp ts) {
    return DateTime::fromTimestamp(ts).toString();
}

} // namespace cbt
