// include/rebalancer/live/trading_calendar.hpp
#pragma once

#include <chrono>
#include <vector>
#include "rebalancer/core/error.hpp"
#include "rebalancer/core/types.hpp"

namespace rebalancer {

/**
 * @brief Maps exchange trading sessions to funding instants
 * Session dates and open times are US/Eastern wall-clock values.
 */
class TradingCalendar {
public:
    /**
     * @brief Opening instant of a session
     * @return CONVERSION_ERROR when the date or open time is malformed
     */
    static Result<Timestamp> session_open(const TradingSession& session);

    /**
     * @brief Funding instant for the first session of a calendar response
     * @param sessions Upcoming sessions, earliest first
     * @param open_offset Delay after the open, one hour by default in configuration
     * @return MARKET_DATA_ERROR when no session is listed
     */
    static Result<Timestamp> next_funding_time(const std::vector<TradingSession>& sessions,
                                               std::chrono::minutes open_offset);
};

}  // namespace rebalancer
