#ifndef DATE_UTILS_HPP
#define DATE_UTILS_HPP

#include "util/result.hpp"

#include <chrono>
#include <string>

using UtcTime = std::chrono::sys_seconds;

struct TimeZoneRule {
    std::string name;
    std::chrono::minutes standardOffset; // Local standard time minus UTC
    bool observesUsDaylightSaving;
};

TimeZoneRule getUtcTimeZone();
TimeZoneRule getUsEasternTimeZone();

// Wall clock time is passed as if it were UTC
bool isUsDaylightSavingTime(UtcTime wallClockTime);

Result<UtcTime> parseLocalDateToUtc(const std::string& dateString, const std::string& format, const TimeZoneRule& zone);
std::string formatUtcDate(UtcTime time);

#endif // DATE_UTILS_HPP
