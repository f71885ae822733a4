#include "util/date_utils.hpp"

#include "util/result.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

TimeZoneRule getUtcTimeZone() {
    return TimeZoneRule{ .name = "UTC", .standardOffset = std::chrono::minutes{ 0 }, .observesUsDaylightSaving = false };
}

TimeZoneRule getUsEasternTimeZone() {
    return TimeZoneRule{ .name = "US/Eastern", .standardOffset = std::chrono::hours{ -5 }, .observesUsDaylightSaving = true };
}

bool isUsDaylightSavingTime(UtcTime wallClockTime) {
    using namespace std::chrono;

    sys_days day = floor<days>(wallClockTime);
    year currentYear = year_month_day{ day }.year();

    // Rules in force since 2007, earlier years used April to October
    sys_days startDay;
    sys_days endDay;
    if (currentYear >= year{ 2007 }) {
        startDay = sys_days{ currentYear / March / Sunday[2] };
        endDay = sys_days{ currentYear / November / Sunday[1] };
    }
    else {
        startDay = sys_days{ currentYear / April / Sunday[1] };
        endDay = sys_days{ currentYear / October / Sunday[last] };
    }

    // Clocks jump from 02:00 to 03:00, the skipped hour and the repeated
    // hour on the last day both resolve to standard time
    return (wallClockTime >= startDay + hours{ 3 }) && (wallClockTime < endDay + hours{ 1 });
}

Result<UtcTime> parseLocalDateToUtc(const std::string& dateString, const std::string& format, const TimeZoneRule& zone) {
    using namespace std::chrono;

    std::tm parsed{};
    std::istringstream stream(dateString);
    stream >> std::get_time(&parsed, format.c_str());
    if (stream.fail()) {
        return makeError(ErrorKind::MalformedHeader, "Date \"" + dateString + "\" does not match format \"" + format + "\".");
    }

    year_month_day date{ year{ parsed.tm_year + 1900 }, month{ static_cast<unsigned>(parsed.tm_mon + 1) }, day{ static_cast<unsigned>(parsed.tm_mday) } };
    if (!date.ok()) {
        return makeError(ErrorKind::MalformedHeader, "Date \"" + dateString + "\" is not a valid calendar date.");
    }

    UtcTime wallClockTime = sys_days{ date } + hours{ parsed.tm_hour } + minutes{ parsed.tm_min } + seconds{ parsed.tm_sec };

    minutes offset = zone.standardOffset;
    if (zone.observesUsDaylightSaving && isUsDaylightSavingTime(wallClockTime)) {
        offset += hours{ 1 };
    }

    return UtcTime{ wallClockTime - offset };
}

std::string formatUtcDate(UtcTime time) {
    using namespace std::chrono;

    sys_days day = floor<days>(time);
    year_month_day date{ day };
    hh_mm_ss timeOfDay{ time - day };

    std::ostringstream ss;
    ss << std::setfill('0')
        << std::setw(4) << static_cast<int>(date.year()) << "-"
        << std::setw(2) << static_cast<unsigned>(date.month()) << "-"
        << std::setw(2) << static_cast<unsigned>(date.day()) << "T"
        << std::setw(2) << timeOfDay.hours().count() << ":"
        << std::setw(2) << timeOfDay.minutes().count() << ":"
        << std::setw(2) << timeOfDay.seconds().count() << "Z";
    return ss.str();
}
