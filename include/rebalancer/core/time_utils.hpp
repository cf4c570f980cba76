#pragma once

#include <time.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include "rebalancer/core/error.hpp"
#include "rebalancer/core/types.hpp"

namespace rebalancer {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Inverse of gmtime: interpret broken-down fields as UTC
 * Fields out of range are normalized (e.g. hour 25 rolls into the next day)
 */
inline std::time_t safe_timegm(std::tm* time) {
#ifdef _WIN32
    return _mkgmtime(time);
#else
    return timegm(time);
#endif
}

/**
 * @brief Format as ISO-8601 UTC, "YYYY-MM-DDTHH:MM:SSZ"
 * Sub-second precision is written as six fractional digits when present.
 */
std::string format_iso8601(Timestamp ts);

/**
 * @brief Parse an ISO-8601 timestamp
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds followed by
 * "Z" or a numeric "+HH:MM"/"-HH:MM" offset. A missing zone designator is read as UTC.
 */
Result<Timestamp> parse_iso8601(const std::string& text);

/**
 * @brief Parse "YYYY-MM-DD" into a tm with the time fields zeroed
 */
Result<std::tm> parse_date(const std::string& text);

std::string format_date(const std::tm& date);

/**
 * @brief Whole days from `from` to `to`, truncated toward zero
 */
int64_t whole_days_between(Timestamp from, Timestamp to);

/**
 * @brief Whether a US/Eastern wall-clock time falls inside daylight saving time
 * Uses the US rule in force since 2007: second Sunday of March at 02:00 until the
 * first Sunday of November at 02:00.
 */
bool is_us_eastern_dst(int year, int month, int day, int hour);

/**
 * @brief Convert a US/Eastern wall-clock time to an instant
 */
Timestamp eastern_to_utc(const std::tm& eastern_local);

/**
 * @brief Convert an instant to US/Eastern wall-clock fields
 */
std::tm utc_to_eastern(Timestamp ts);

/**
 * @brief Calendar days between the New York dates of two instants
 *
 * Counts date changes rather than elapsed hours, so 10:30 Monday to 10:29 Tuesday is one
 * day and a weekend spanning a DST change is still three.
 */
int64_t eastern_days_between(Timestamp from, Timestamp to);

/**
 * @brief First instant of the New York calendar day after the one containing ts
 */
Timestamp next_eastern_midnight(Timestamp ts);

/**
 * @brief Sleep until the deadline in steps of poll_interval
 * @return true when the deadline was reached, false when stop was raised first
 */
bool wait_until(Timestamp deadline, std::chrono::milliseconds poll_interval,
                const std::atomic<bool>& stop);

}  // namespace core
}  // namespace rebalancer
