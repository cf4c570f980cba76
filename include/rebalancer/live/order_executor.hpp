// include/rebalancer/live/order_executor.hpp
#pragma once

#include <string>
#include <vector>
#include "rebalancer/allocation/allocation_planner.hpp"
#include "rebalancer/broker/broker_interface.hpp"
#include "rebalancer/core/error.hpp"
#include "rebalancer/core/types.hpp"

namespace rebalancer {

/**
 * @brief Orders placed for one plan
 */
struct ExecutionSummary {
    std::vector<Order> orders;
    std::vector<std::string> broker_order_ids;
};

/**
 * @brief Turns planned purchases into day limit buy orders and submits them
 *
 * The limit sits a fixed fraction below the reference price and is submitted rounded
 * down to whole cents. The quantity is the number of whole units the planned dollars
 * buy at the unrounded limit.
 * Submission is fail-fast: the first rejected order aborts the rest of the plan and
 * orders already placed stand.
 */
class OrderExecutor {
public:
    /**
     * @param broker Broker receiving the orders
     * @param limit_price_discount Fraction below the reference price, e.g. 0.001
     */
    OrderExecutor(BrokerInterface& broker, double limit_price_discount);

    /**
     * @brief Build the order for one purchase
     * @return INVALID_ORDER when the price rounds to zero cents or the amount buys no unit
     */
    Result<Order> build_order(const std::string& symbol, Price reference_price,
                              double amount) const;

    /**
     * @brief Submit every purchase of a plan in order
     * @param plan Purchases indexed into positions
     * @param positions Snapshot the plan was built from
     */
    Result<ExecutionSummary> execute(const PurchasePlan& plan,
                                     const std::vector<PositionSnapshot>& positions);

private:
    BrokerInterface& broker_;
    double limit_price_discount_;
};

}  // namespace rebalancer
