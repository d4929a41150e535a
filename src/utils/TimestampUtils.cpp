#include "archname/utils/TimestampUtils.h"
#include <cstdio>

namespace arn {

namespace {

// Days since 1970-01-01 to civil date (proleptic Gregorian)
void civilFromDays(int64_t days, int& year, int& month, int& day) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;

    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

} // namespace

int64_t TimestampUtils::microsSinceEpoch(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::microseconds>(time.time_since_epoch()).count();
}

TimestampUtils::UtcTime TimestampUtils::toUtc(TimePoint time) {
    int64_t micros = microsSinceEpoch(time);

    int64_t seconds = micros / 1000000;
    int64_t fraction = micros % 1000000;
    if (fraction < 0) {
        fraction += 1000000;
        seconds -= 1;
    }

    int64_t days = seconds / 86400;
    int64_t secondOfDay = seconds % 86400;
    if (secondOfDay < 0) {
        secondOfDay += 86400;
        days -= 1;
    }

    UtcTime result = {};
    civilFromDays(days, result.year, result.month, result.day);
    result.hour = static_cast<int>(secondOfDay / 3600);
    result.minute = static_cast<int>((secondOfDay % 3600) / 60);
    result.second = static_cast<int>(secondOfDay % 60);
    result.micros = static_cast<int>(fraction);
    return result;
}

std::string TimestampUtils::formatTime(TimePoint time) {
    UtcTime utc = toUtc(time);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d%02d%02d", utc.hour, utc.minute, utc.second);
    return buf;
}

std::string TimestampUtils::formatDateTime(TimePoint time) {
    UtcTime utc = toUtc(time);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d%02d%02d%02d",
                  utc.year, utc.month, utc.day, utc.hour, utc.minute, utc.second);
    return buf;
}

std::string TimestampUtils::formatDateTimeMicros(TimePoint time) {
    UtcTime utc = toUtc(time);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d%02d%02d%02d%06d",
                  utc.year, utc.month, utc.day, utc.hour, utc.minute, utc.second, utc.micros);
    return buf;
}

std::string TimestampUtils::toBase36(uint64_t value) {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value > 0) {
        out.insert(out.begin(), digits[value % 36]);
        value /= 36;
    }
    return out;
}

TimestampUtils::Clock TimestampUtils::systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

} // namespace arn
