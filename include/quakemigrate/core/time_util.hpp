#pragma once

#include "types.hpp"
#include <string>

namespace quakemigrate {

// ISO-8601 UTC with microseconds, e.g. 2021-03-04T05:06:07.123456
std::string formatTime(TimePoint t);

// Compact event identifier, e.g. 20210304050607123456
std::string formatUid(TimePoint t);

// Parses "YYYY-MM-DD[THH:MM:SS[.ffffff]]" (a space may replace the 'T').
// Returns false on malformed input.
bool parseTime(const std::string& text, TimePoint& out);

// Midnight UTC of the day containing t
TimePoint startOfDay(TimePoint t);

// Year and day-of-year (1-based) of t in UTC
void yearAndJulianDay(TimePoint t, int& year, int& jday);

// "YYYY_JJJ", the label day-partitioned output files carry
std::string dayLabel(TimePoint t);

} // namespace quakemigrate
