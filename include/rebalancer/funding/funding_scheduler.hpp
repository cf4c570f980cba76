// include/rebalancer/funding/funding_scheduler.hpp
#pragma once

#include <cstdint>
#include "rebalancer/core/error.hpp"
#include "rebalancer/core/types.hpp"
#include "rebalancer/funding/checkpoint.hpp"

namespace rebalancer {

/**
 * @brief How much to invest today and how it was derived
 */
struct FundingDecision {
    double total_invested{0.0};     // equity - cash
    int64_t days_remaining{0};      // whole days until finish_date
    double additional_needed{0.0};  // equity * target_ratio - total_invested
    double daily_funding{0.0};      // max(0, additional_needed / days_remaining)
    int64_t days_elapsed{0};        // New York dates since last funding, 1 on the first cycle
    double funding_today{0.0};      // daily_funding * days_elapsed

    bool should_fund() const {
        return funding_today > 0.0;
    }
};

/**
 * @brief Decides each trading day how many dollars to put to work
 *
 * Owns the checkpoint for the lifetime of a run. The funding rate spreads the gap
 * between the target invested ratio and the current invested amount evenly over the
 * days left until finish_date; days skipped since the last funding are caught up.
 * Elapsed days are counted between New York calendar dates, so the time of day a
 * cycle happens to wake at does not change the count.
 * The checkpoint changes only through mark_funded().
 */
class FundingScheduler {
public:
    explicit FundingScheduler(Checkpoint checkpoint);

    /**
     * @brief Compute today's funding
     * @param account Account figures for now
     * @param now Current time
     * @return The decision; PRECONDITION_VIOLATION when finish_date is not at least a
     *         whole day ahead or the daily rate is not a non-negative number;
     *         INSUFFICIENT_FUNDS when buying power does not cover one day's rate
     */
    Result<FundingDecision> compute_funding(const AccountSnapshot& account, Timestamp now) const;

    /**
     * @brief Earliest instant the next cycle may run
     * @return now when never funded, otherwise max(now, start of the New York day after
     *         last_funding_date)
     */
    Timestamp earliest_next_funding(Timestamp now) const;

    /**
     * @brief Record a completed funding cycle
     * Call only after every order of the cycle has been submitted.
     */
    void mark_funded(Timestamp now);

    const Checkpoint& checkpoint() const {
        return checkpoint_;
    }

private:
    Checkpoint checkpoint_;
};

}  // namespace rebalancer
