// src/funding/funding_scheduler.cpp
#include "rebalancer/funding/funding_scheduler.hpp"
#include <algorithm>
#include <string>
#include "rebalancer/core/logger.hpp"
#include "rebalancer/core/time_utils.hpp"

namespace rebalancer {

FundingScheduler::FundingScheduler(Checkpoint checkpoint) : checkpoint_(std::move(checkpoint)) {
    Logger::register_component("FundingScheduler");
}

Result<FundingDecision> FundingScheduler::compute_funding(const AccountSnapshot& account,
                                                          Timestamp now) const {
    // Built and driven by the agent on its own thread, so retag for the log lines below
    Logger::register_component("FundingScheduler");
    FundingDecision decision;

    decision.total_invested = account.equity - account.cash;
    decision.days_remaining = core::whole_days_between(now, checkpoint_.finish_date);
    if (decision.days_remaining <= 0) {
        return make_error<FundingDecision>(
            ErrorCode::PRECONDITION_VIOLATION,
            "Finish date " + core::format_iso8601(checkpoint_.finish_date) +
                " is not at least one day ahead of " + core::format_iso8601(now) +
                " (days remaining: " + std::to_string(decision.days_remaining) + ")",
            "FundingScheduler");
    }

    decision.additional_needed =
        account.equity * checkpoint_.target_investment_equity_ratio - decision.total_invested;
    decision.daily_funding = std::max(
        0.0, decision.additional_needed / static_cast<double>(decision.days_remaining));

    INFO("Account equity = " << account.equity << ", cash = " << account.cash
                             << ", buying power = " << account.buying_power);
    INFO("Daily funding = " << decision.daily_funding << " over " << decision.days_remaining
                            << " remaining days");

    // Written as a negation so that NaN fails too
    if (!(decision.daily_funding >= 0.0)) {
        return make_error<FundingDecision>(
            ErrorCode::PRECONDITION_VIOLATION,
            "Daily funding is not a non-negative number: " +
                std::to_string(decision.daily_funding),
            "FundingScheduler");
    }

    if (!(account.buying_power >= decision.daily_funding)) {
        return make_error<FundingDecision>(
            ErrorCode::INSUFFICIENT_FUNDS,
            "Buying power " + std::to_string(account.buying_power) +
                " does not cover daily funding " + std::to_string(decision.daily_funding),
            "FundingScheduler");
    }

    decision.days_elapsed = checkpoint_.last_funding_date
                                ? core::eastern_days_between(*checkpoint_.last_funding_date, now)
                                : 1;
    decision.funding_today = decision.daily_funding * static_cast<double>(decision.days_elapsed);

    INFO("Funding today = " << decision.funding_today << " (" << decision.days_elapsed
                            << " day(s) since last funding)");

    return Result<FundingDecision>(decision);
}

Timestamp FundingScheduler::earliest_next_funding(Timestamp now) const {
    if (!checkpoint_.last_funding_date) {
        return now;
    }
    return std::max(now, core::next_eastern_midnight(*checkpoint_.last_funding_date));
}

void FundingScheduler::mark_funded(Timestamp now) {
    checkpoint_.last_funding_date = now;
}

}  // namespace rebalancer
