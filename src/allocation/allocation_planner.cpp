// src/allocation/allocation_planner.cpp
#include "rebalancer/allocation/allocation_planner.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include "rebalancer/allocation/asset_selector.hpp"
#include "rebalancer/core/logger.hpp"

namespace rebalancer {

double PurchasePlan::total_amount() const {
    double total = 0.0;
    for (const auto& purchase : purchases) {
        total += purchase.amount;
    }
    return total;
}

AllocationPlanner::AllocationPlanner() {
    Logger::register_component("AllocationPlanner");
}

Result<void> AllocationPlanner::validate_inputs(const std::vector<double>& initial_equities,
                                                const std::vector<double>& prices,
                                                const std::vector<double>& ideal_fractions,
                                                double total_budget) const {
    if (initial_equities.size() != prices.size() ||
        initial_equities.size() != ideal_fractions.size()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Input vectors must have the same size: " +
                                    std::to_string(initial_equities.size()) + ", " +
                                    std::to_string(prices.size()) + ", " +
                                    std::to_string(ideal_fractions.size()),
                                "AllocationPlanner");
    }

    for (size_t i = 0; i < prices.size(); ++i) {
        if (!std::isfinite(prices[i]) || prices[i] <= 0.0) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Price at index " + std::to_string(i) +
                                        " must be positive and finite, got " +
                                        std::to_string(prices[i]),
                                    "AllocationPlanner");
        }
        if (!std::isfinite(initial_equities[i])) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    "Equity at index " + std::to_string(i) + " is not finite",
                                    "AllocationPlanner");
        }
    }

    if (std::isnan(total_budget) || std::isinf(total_budget)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Budget must be finite",
                                "AllocationPlanner");
    }

    return Result<void>();
}

Result<PurchasePlan> AllocationPlanner::plan(const std::vector<double>& initial_equities,
                                             const std::vector<double>& prices,
                                             const std::vector<double>& ideal_fractions,
                                             double total_budget) const {
    auto validation = validate_inputs(initial_equities, prices, ideal_fractions, total_budget);
    if (validation.is_error()) {
        return forward_error<PurchasePlan>(validation, "AllocationPlanner");
    }

    PurchasePlan plan;
    plan.projected_equities = initial_equities;
    plan.remaining_budget = total_budget;

    while (true) {
        ++plan.iterations;

        const double budget = plan.remaining_budget;
        bool affordable = std::any_of(prices.begin(), prices.end(),
                                      [budget](double p) { return p <= budget; });
        if (!affordable) {
            break;
        }

        auto selection =
            select_best_asset(plan.projected_equities, prices, ideal_fractions, budget);
        if (!selection) {
            DEBUG("No qualifying asset with " << budget << " remaining, stopping");
            break;
        }

        plan.purchases.push_back(PlannedPurchase{selection->index, selection->amount});
        plan.projected_equities[selection->index] += selection->amount;
        plan.remaining_budget -= selection->amount;
    }

    DEBUG("Planned " << plan.purchases.size() << " purchases totalling " << plan.total_amount()
                     << " of " << total_budget << " in " << plan.iterations << " iterations");

    return Result<PurchasePlan>(std::move(plan));
}

}  // namespace rebalancer
