#ifndef ARCHNAME_TIMESTAMP_UTILS_H
#define ARCHNAME_TIMESTAMP_UTILS_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace arn {

/**
 * Timestamp formatting for disambiguation suffixes
 *
 * All fields are UTC so that names do not depend on the host time zone.
 */
class TimestampUtils {
public:
    using TimePoint = std::chrono::system_clock::time_point;
    using Clock = std::function<TimePoint()>;

    /**
     * Broken-down UTC time plus sub-second microseconds
     */
    struct UtcTime {
        int year;
        int month;      // 1-12
        int day;        // 1-31
        int hour;
        int minute;
        int second;
        int micros;     // 0-999999
    };

    static UtcTime toUtc(TimePoint time);

    /**
     * "HHMMSS"
     */
    static std::string formatTime(TimePoint time);

    /**
     * "YYYYMMDDHHMMSS"
     */
    static std::string formatDateTime(TimePoint time);

    /**
     * "YYYYMMDDHHMMSSffffff"
     */
    static std::string formatDateTimeMicros(TimePoint time);

    /**
     * Microseconds since the Unix epoch (negative before 1970)
     */
    static int64_t microsSinceEpoch(TimePoint time);

    /**
     * Lowercase base-36 rendering of an unsigned value
     */
    static std::string toBase36(uint64_t value);

    /**
     * Clock reading std::chrono::system_clock
     */
    static Clock systemClock();
};

} // namespace arn

#endif // ARCHNAME_TIMESTAMP_UTILS_H
