// include/rebalancer/broker/broker_interface.hpp
#pragma once

#include <string>
#include <vector>
#include "rebalancer/core/error.hpp"
#include "rebalancer/core/types.hpp"

namespace rebalancer {

/**
 * @brief Brokerage account the agent trades through
 *
 * Implementations report failures as error results and never retry; the caller
 * decides whether a failure aborts the cycle.
 */
class BrokerInterface {
public:
    virtual ~BrokerInterface() = default;

    virtual Result<AccountSnapshot> get_account() = 0;

    /**
     * @brief Current positions
     * The returned order defines asset indices for one planning cycle.
     */
    virtual Result<std::vector<PositionSnapshot>> get_positions() = 0;

    /**
     * @brief Trading sessions between two dates, inclusive
     * @param start_date "YYYY-MM-DD"
     * @param end_date "YYYY-MM-DD"
     */
    virtual Result<std::vector<TradingSession>> get_calendar(const std::string& start_date,
                                                             const std::string& end_date) = 0;

    /**
     * @brief Place an order
     * @return Broker-assigned order id
     */
    virtual Result<std::string> submit_order(const Order& order) = 0;
};

}  // namespace rebalancer
