// include/rebalancer/allocation/allocation_planner.hpp
#pragma once

#include <cstddef>
#include <vector>
#include "rebalancer/core/error.hpp"

namespace rebalancer {

/**
 * @brief One purchase instruction of a plan
 */
struct PlannedPurchase {
    size_t asset_index;  // Index into the vectors the plan was built from
    double amount;       // Dollars to spend
};

/**
 * @brief Ordered purchase instructions for one funding pool
 */
struct PurchasePlan {
    std::vector<PlannedPurchase> purchases;
    std::vector<double> projected_equities;  // Equities after every purchase is applied
    double remaining_budget{0.0};
    int iterations{0};                       // Loop passes, including the terminal one

    double total_amount() const;
};

/**
 * @brief Greedy planner that spends a funding pool one increment at a time
 *
 * Each step asks select_best_asset for the single best increment under the remaining
 * budget, applies it to the running equities and deducts it from the budget. Planning
 * stops when no price fits the remaining budget or when no candidate qualifies.
 * The planner holds no mutable state; plan() may be called concurrently.
 */
class AllocationPlanner {
public:
    AllocationPlanner();

    /**
     * @brief Build a purchase plan
     * @param initial_equities Current equity per asset
     * @param prices Current unit price per asset (finite, > 0)
     * @param ideal_fractions Target fraction per asset
     * @param total_budget Dollars available; zero or less gives an empty plan
     * @return Result containing the plan, or INVALID_ARGUMENT on malformed inputs
     */
    Result<PurchasePlan> plan(const std::vector<double>& initial_equities,
                              const std::vector<double>& prices,
                              const std::vector<double>& ideal_fractions,
                              double total_budget) const;

private:
    Result<void> validate_inputs(const std::vector<double>& initial_equities,
                                 const std::vector<double>& prices,
                                 const std::vector<double>& ideal_fractions,
                                 double total_budget) const;
};

}  // namespace rebalancer
