// src/core/time_utils.cpp

#include "rebalancer/core/time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <thread>

namespace rebalancer {
namespace core {

namespace {

constexpr int kEasternStandardOffsetHours = 5;
constexpr int kEasternDaylightOffsetHours = 4;

// Day of week (0 = Sunday) for a civil date
int day_of_week(int year, int month, int day) {
    std::tm t{};
    t.tm_year = year - 1900;
    t.tm_mon = month - 1;
    t.tm_mday = day;
    t.tm_hour = 12;
    std::time_t secs = safe_timegm(&t);
    std::tm out{};
    safe_gmtime(&secs, &out);
    return out.tm_wday;
}

int first_sunday(int year, int month) {
    int wday = day_of_week(year, month, 1);
    return 1 + (7 - wday) % 7;
}

// New York calendar date of an instant, as seconds of that date's midnight on a UTC clock
std::time_t eastern_date_seconds(Timestamp ts) {
    std::tm date = utc_to_eastern(ts);
    date.tm_hour = 0;
    date.tm_min = 0;
    date.tm_sec = 0;
    return safe_timegm(&date);
}

}  // namespace

std::string format_iso8601(Timestamp ts) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(ts);
    if (secs > ts) {
        secs -= std::chrono::seconds(1);
    }
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(ts - secs).count();

    std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm utc{};
    safe_gmtime(&t, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (micros != 0) {
        ss << "." << std::setw(6) << std::setfill('0') << micros;
    }
    ss << "Z";
    return ss.str();
}

Result<Timestamp> parse_iso8601(const std::string& text) {
    std::tm t{};
    std::istringstream ss(text);
    ss >> std::get_time(&t, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Invalid ISO-8601 timestamp: '" + text + "'", "TimeUtils");
    }

    std::string rest;
    std::getline(ss, rest);

    size_t pos = 0;
    int64_t nanos = 0;
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (rest[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                         "Invalid fractional seconds in '" + text + "'",
                                         "TimeUtils");
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }

    int offset_minutes = 0;
    std::string zone = rest.substr(pos);
    if (zone == "Z" || zone.empty()) {
        offset_minutes = 0;
    } else if ((zone[0] == '+' || zone[0] == '-') && zone.size() == 6 && zone[3] == ':') {
        int hh = 0;
        int mm = 0;
        if (std::sscanf(zone.c_str() + 1, "%2d:%2d", &hh, &mm) != 2) {
            return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                         "Invalid UTC offset in '" + text + "'", "TimeUtils");
        }
        offset_minutes = (hh * 60 + mm) * (zone[0] == '-' ? -1 : 1);
    } else {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Invalid zone designator in '" + text + "'", "TimeUtils");
    }

    std::time_t secs = safe_timegm(&t);
    Timestamp ts = std::chrono::system_clock::from_time_t(secs) - std::chrono::minutes(offset_minutes);
    ts += std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::nanoseconds(nanos));
    return Result<Timestamp>(ts);
}

Result<std::tm> parse_date(const std::string& text) {
    std::tm t{};
    std::istringstream ss(text);
    ss >> std::get_time(&t, "%Y-%m-%d");
    if (ss.fail()) {
        return make_error<std::tm>(ErrorCode::CONVERSION_ERROR, "Invalid date: '" + text + "'",
                                   "TimeUtils");
    }
    t.tm_hour = 0;
    t.tm_min = 0;
    t.tm_sec = 0;
    return Result<std::tm>(t);
}

std::string format_date(const std::tm& date) {
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &date);
    return std::string(buffer);
}

int64_t whole_days_between(Timestamp from, Timestamp to) {
    return std::chrono::duration_cast<Days>(to - from).count();
}

bool is_us_eastern_dst(int year, int month, int day, int hour) {
    if (month < 3 || month > 11) {
        return false;
    }
    if (month > 3 && month < 11) {
        return true;
    }
    if (month == 3) {
        int start = first_sunday(year, 3) + 7;
        return day > start || (day == start && hour >= 2);
    }
    int end = first_sunday(year, 11);
    return day < end || (day == end && hour < 2);
}

Timestamp eastern_to_utc(const std::tm& eastern_local) {
    std::tm fields = eastern_local;
    // Normalize first so that e.g. "09:30 + 60 minutes" is judged at 10:30
    std::time_t as_utc = safe_timegm(&fields);
    bool dst = is_us_eastern_dst(fields.tm_year + 1900, fields.tm_mon + 1, fields.tm_mday,
                                 fields.tm_hour);
    int offset = dst ? kEasternDaylightOffsetHours : kEasternStandardOffsetHours;
    return std::chrono::system_clock::from_time_t(as_utc) + std::chrono::hours(offset);
}

std::tm utc_to_eastern(Timestamp ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);

    std::tm standard{};
    std::time_t standard_secs = t - kEasternStandardOffsetHours * 3600;
    safe_gmtime(&standard_secs, &standard);

    std::tm daylight{};
    std::time_t daylight_secs = t - kEasternDaylightOffsetHours * 3600;
    safe_gmtime(&daylight_secs, &daylight);

    // The spring transition is stated in standard time, the autumn one in daylight time
    const std::tm& reference = standard.tm_mon < 6 ? standard : daylight;
    bool dst = is_us_eastern_dst(reference.tm_year + 1900, reference.tm_mon + 1, reference.tm_mday,
                                 reference.tm_hour);
    return dst ? daylight : standard;
}

int64_t eastern_days_between(Timestamp from, Timestamp to) {
    return (eastern_date_seconds(to) - eastern_date_seconds(from)) / 86400;
}

Timestamp next_eastern_midnight(Timestamp ts) {
    std::tm date = utc_to_eastern(ts);
    date.tm_mday += 1;
    date.tm_hour = 0;
    date.tm_min = 0;
    date.tm_sec = 0;
    return eastern_to_utc(date);
}

bool wait_until(Timestamp deadline, std::chrono::milliseconds poll_interval,
                const std::atomic<bool>& stop) {
    while (std::chrono::system_clock::now() < deadline) {
        if (stop.load(std::memory_order_acquire)) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::system_clock::now());
        std::this_thread::sleep_for(
            std::max(std::chrono::milliseconds(1), std::min(poll_interval, remaining)));
    }
    return !stop.load(std::memory_order_acquire);
}

}  // namespace core
}  // namespace rebalancer
