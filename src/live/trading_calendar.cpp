// src/live/trading_calendar.cpp
#include "rebalancer/live/trading_calendar.hpp"
#include <cstdio>
#include "rebalancer/core/time_utils.hpp"

namespace rebalancer {

namespace {

// Session open as Eastern wall-clock fields
Result<std::tm> local_open(const TradingSession& session) {
    auto date = core::parse_date(session.date);
    if (date.is_error()) {
        return forward_error<std::tm>(date, "TradingCalendar");
    }

    int hour = 0;
    int minute = 0;
    if (std::sscanf(session.open.c_str(), "%d:%d", &hour, &minute) != 2 || hour < 0 ||
        hour > 23 || minute < 0 || minute > 59) {
        return make_error<std::tm>(ErrorCode::CONVERSION_ERROR,
                                   "Invalid session open time '" + session.open + "' on " +
                                       session.date,
                                   "TradingCalendar");
    }

    std::tm local = date.value();
    local.tm_hour = hour;
    local.tm_min = minute;
    return Result<std::tm>(local);
}

}  // namespace

Result<Timestamp> TradingCalendar::session_open(const TradingSession& session) {
    auto local = local_open(session);
    if (local.is_error()) {
        return forward_error<Timestamp>(local, "TradingCalendar");
    }
    return Result<Timestamp>(core::eastern_to_utc(local.value()));
}

Result<Timestamp> TradingCalendar::next_funding_time(const std::vector<TradingSession>& sessions,
                                                     std::chrono::minutes open_offset) {
    if (sessions.empty()) {
        return make_error<Timestamp>(ErrorCode::MARKET_DATA_ERROR,
                                     "Market calendar returned no upcoming sessions",
                                     "TradingCalendar");
    }

    auto local = local_open(sessions.front());
    if (local.is_error()) {
        return forward_error<Timestamp>(local, "TradingCalendar");
    }

    // The offset is applied to the wall clock; eastern_to_utc normalizes minute overflow
    std::tm funding = local.value();
    funding.tm_min += static_cast<int>(open_offset.count());
    return Result<Timestamp>(core::eastern_to_utc(funding));
}

}  // namespace rebalancer
