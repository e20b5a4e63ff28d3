#include "quakemigrate/core/time_util.hpp"
#include <cctype>
#include <ctime>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace quakemigrate {

namespace {

// Splits t into whole seconds since the epoch and microseconds in [0, 1e6)
void splitTime(TimePoint t, std::time_t& secs, int64_t& micros) {
    int64_t total = std::chrono::duration_cast<Duration>(t.time_since_epoch()).count();
    int64_t s = total / 1000000;
    int64_t us = total % 1000000;
    if (us < 0) {
        us += 1000000;
        s -= 1;
    }
    secs = static_cast<std::time_t>(s);
    micros = us;
}

std::tm utcTm(std::time_t secs) {
    std::tm tm = {};
    gmtime_r(&secs, &tm);
    return tm;
}

} // namespace

std::string formatTime(TimePoint t) {
    std::time_t secs;
    int64_t micros;
    splitTime(t, secs, micros);
    std::tm tm = utcTm(secs);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

std::string formatUid(TimePoint t) {
    std::time_t secs;
    int64_t micros;
    splitTime(t, secs, micros);
    std::tm tm = utcTm(secs);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d%H%M%S")
        << std::setw(6) << std::setfill('0') << micros;
    return oss.str();
}

bool parseTime(const std::string& text, TimePoint& out) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    std::string rest;

    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) return false;

    int64_t micros = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        int n = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d:%2d%n",
                        &hour, &minute, &second, &n) != 3) {
            return false;
        }
        pos += 1 + static_cast<size_t>(n);
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            int64_t scale = 100000;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                micros += (text[pos] - '0') * scale;
                scale /= 10;
                ++pos;
            }
        }
        if (pos < text.size() && text[pos] == 'Z') ++pos;
    }
    if (pos != text.size()) return false;
    if (hour > 23 || minute > 59 || second > 60) return false;

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    out = std::chrono::system_clock::from_time_t(timegm(&tm)) +
          std::chrono::duration_cast<TimePoint::duration>(Duration(micros));
    return true;
}

TimePoint startOfDay(TimePoint t) {
    std::time_t secs;
    int64_t micros;
    splitTime(t, secs, micros);
    secs -= secs % 86400;
    return std::chrono::system_clock::from_time_t(secs);
}

void yearAndJulianDay(TimePoint t, int& year, int& jday) {
    std::time_t secs;
    int64_t micros;
    splitTime(t, secs, micros);
    std::tm tm = utcTm(secs);
    year = tm.tm_year + 1900;
    jday = tm.tm_yday + 1;
}

std::string dayLabel(TimePoint t) {
    int year, jday;
    yearAndJulianDay(t, year, jday);
    std::ostringstream oss;
    oss << year << "_" << std::setw(3) << std::setfill('0') << jday;
    return oss.str();
}

} // namespace quakemigrate
