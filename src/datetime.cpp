/**
 * @file datetime.cpp
 * @brief DateTime conversions
 */

#include "cbt/datetime.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cbt {

namespace {

constexpr Timestamp kMillisPerSecond = 1000;
constexpr Timestamp kMillisPerDay = 86400 * kMillisPerSecond;

// Days since 1970-01-01 for a proleptic Gregorian date
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, int& y, int& m, int& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2));
}

bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m == 2 && isLeapYear(y) ? 29 : kDays[m - 1];
}

int readField(const std::string& str, Size pos, Size len) {
    if (pos + len > str.size()) {
        throw std::invalid_argument("truncated date-time: " + str);
    }
    int value = 0;
    for (Size i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
            throw std::invalid_argument("malformed date-time: " + str);
        }
        value = value * 10 + (str[i] - '0');
    }
    return value;
}

} // namespace

Timestamp DateTime::toTimestamp() const {
    std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month),
                                      static_cast<unsigned>(day));
    return days * kMillisPerDay
         + (static_cast<Timestamp>(hour) * 3600 + minute * 60 + second) * kMillisPerSecond
         + millisecond;
}

DateTime DateTime::fromTimestamp(Timestamp ts) {
    std::int64_t days = ts / kMillisPerDay;
    Timestamp rem = ts % kMillisPerDay;
    if (rem < 0) {
        rem += kMillisPerDay;
        --days;
    }

    DateTime dt;
    civilFromDays(days, dt.year, dt.month, dt.day);
    dt.hour = static_cast<int>(rem / (3600 * kMillisPerSecond));
    rem %= 3600 * kMillisPerSecond;
    dt.minute = static_cast<int>(rem / (60 * kMillisPerSecond));
    rem %= 60 * kMillisPerSecond;
    dt.second = static_cast<int>(rem / kMillisPerSecond);
    dt.millisecond = static_cast<int>(rem % kMillisPerSecond);
    return dt;
}

DateTime DateTime::parse(const std::string& str) {
    if (str.size() < 10 || str[4] != '-' || str[7] != '-') {
        throw std::invalid_argument("malformed date: " + str);
    }

    DateTime dt;
    dt.year = readField(str, 0, 4);
    dt.month = readField(str, 5, 2);
    dt.day = readField(str, 8, 2);
    if (dt.month < 1 || dt.month > 12 || dt.day < 1 || dt.day > daysInMonth(dt.year, dt.month)) {
        throw std::invalid_argument("date out of range: " + str);
    }

    if (str.size() > 10) {
        if ((str[10] != ' ' && str[10] != 'T') || str.size() < 19
            || str[13] != ':' || str[16] != ':') {
            throw std::invalid_argument("malformed time: " + str);
        }
        dt.hour = readField(str, 11, 2);
        dt.minute = readField(str, 14, 2);
        dt.second = readField(str, 17, 2);
        if (dt.hour > 23 || dt.minute > 59 || dt.second > 60) {
            throw std::invalid_argument("time out of range: " + str);
        }
        // optional fraction and/or 'Z' suffix
        Size pos = 19;
        if (pos < str.size() && str[pos] == '.') {
            ++pos;
            Size digits = 0;
            int ms = 0;
            while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
                if (digits < 3) ms = ms * 10 + (str[pos] - '0');
                ++digits;
                ++pos;
            }
            for (; digits < 3; ++digits) ms *= 10;
            dt.millisecond = ms;
        }
        if (pos < str.size() && str[pos] == 'Z') ++pos;
        if (pos != str.size()) {
            throw std::invalid_argument("trailing characters in date-time: " + str);
        }
    }
    return dt;
}

std::string DateTime::toString() const {
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << year << "-"
        << std::setw(2) << month << "-"
        << std::setw(2) << day;
    if (hour || minute || second) {
        oss << " " << std::setw(2) << hour << ":"
            << std::setw(2) << minute << ":"
            << std::setw(2) << second;
    }
    return oss.str();
}

} // namespace cbt
