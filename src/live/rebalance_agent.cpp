// src/live/rebalance_agent.cpp
#include "rebalancer/live/rebalance_agent.hpp"
#include <algorithm>
#include <chrono>
#include <sstream>
#include "rebalancer/core/logger.hpp"
#include "rebalancer/core/time_utils.hpp"
#include "rebalancer/live/trading_calendar.hpp"

namespace rebalancer {

RebalanceAgent::RebalanceAgent(AgentConfig config, BrokerInterface& broker, CheckpointStore& store)
    : config_(std::move(config)),
      broker_(broker),
      store_(store),
      executor_(broker, config_.limit_price_discount) {
    Logger::register_component("RebalanceAgent");
}

Result<Checkpoint> RebalanceAgent::load_or_initialize(Timestamp now) {
    auto loaded = store_.load();
    if (loaded.is_ok()) {
        return loaded;
    }

    if (store_.exists()) {
        WARN("Checkpoint " << store_.path() << " is not loadable (" << loaded.error()->what()
                           << "), re-initializing from live positions");
    } else {
        INFO("No checkpoint at " << store_.path() << ", initializing from live positions");
    }

    auto positions = broker_.get_positions();
    if (positions.is_error()) {
        return forward_error<Checkpoint>(positions, "RebalanceAgent");
    }

    Checkpoint checkpoint = Checkpoint::from_positions(
        positions.value(), now, config_.default_target_ratio, config_.default_horizon_days);

    for (const auto& entry : checkpoint.ideal_allocations) {
        INFO("Ideal allocation " << entry.first << " = " << entry.second);
    }
    INFO("Target ratio " << checkpoint.target_investment_equity_ratio << ", finish date "
                         << core::format_iso8601(checkpoint.finish_date));

    auto saved = store_.save(checkpoint);
    if (saved.is_error()) {
        return forward_error<Checkpoint>(saved, "RebalanceAgent");
    }
    return Result<Checkpoint>(std::move(checkpoint));
}

Result<Timestamp> RebalanceAgent::next_funding_time(Timestamp earliest) {
    std::tm start = core::utc_to_eastern(earliest);
    start.tm_hour = 12;  // Keep date arithmetic clear of any midnight edge
    std::tm end = start;
    end.tm_mday += config_.calendar_lookahead_days;
    std::time_t end_secs = core::safe_timegm(&end);
    core::safe_gmtime(&end_secs, &end);

    auto sessions = broker_.get_calendar(core::format_date(start), core::format_date(end));
    if (sessions.is_error()) {
        return forward_error<Timestamp>(sessions, "RebalanceAgent");
    }

    return TradingCalendar::next_funding_time(
        sessions.value(), std::chrono::minutes(config_.open_offset_minutes));
}

Result<CycleReport> RebalanceAgent::run_cycle(FundingScheduler& scheduler, Timestamp now) {
    CycleReport report;

    auto account = broker_.get_account();
    if (account.is_error()) {
        return forward_error<CycleReport>(account, "RebalanceAgent");
    }

    auto decision = scheduler.compute_funding(account.value(), now);
    Logger::register_component("RebalanceAgent");
    if (decision.is_error()) {
        return forward_error<CycleReport>(decision, "RebalanceAgent");
    }
    report.decision = decision.value();

    if (!report.decision.should_fund()) {
        INFO("Nothing to fund today");
        return Result<CycleReport>(std::move(report));
    }

    auto positions = broker_.get_positions();
    if (positions.is_error()) {
        return forward_error<CycleReport>(positions, "RebalanceAgent");
    }
    report.positions = positions.value();

    const Checkpoint& checkpoint = scheduler.checkpoint();
    std::vector<double> equities;
    std::vector<double> prices;
    std::vector<double> ideal_fractions;
    for (const auto& position : report.positions) {
        equities.push_back(position.market_value);
        prices.push_back(position.current_price);
        ideal_fractions.push_back(checkpoint.ideal_fraction(position.symbol));
    }

    for (const auto& entry : checkpoint.ideal_allocations) {
        bool held = std::any_of(report.positions.begin(), report.positions.end(),
                                [&entry](const PositionSnapshot& p) { return p.symbol == entry.first; });
        if (!held) {
            WARN("No position reported for " << entry.first << ", it cannot be funded");
        }
    }

    auto plan = planner_.plan(equities, prices, ideal_fractions, report.decision.funding_today);
    if (plan.is_error()) {
        return forward_error<CycleReport>(plan, "RebalanceAgent");
    }
    report.plan = plan.value();

    std::ostringstream orders;
    for (const auto& purchase : report.plan.purchases) {
        orders << " (" << report.positions[purchase.asset_index].symbol << ", " << purchase.amount
               << ")";
    }
    INFO("Orders:" << orders.str());

    auto execution = executor_.execute(report.plan, report.positions);
    if (execution.is_error()) {
        return forward_error<CycleReport>(execution, "RebalanceAgent");
    }
    report.execution = execution.value();

    scheduler.mark_funded(now);
    auto saved = store_.save(scheduler.checkpoint());
    if (saved.is_error()) {
        return forward_error<CycleReport>(saved, "RebalanceAgent");
    }
    report.funded = true;

    INFO("Funded " << report.plan.total_amount() << " of " << report.decision.funding_today
                   << " across " << report.execution.orders.size() << " orders");
    return Result<CycleReport>(std::move(report));
}

Result<void> RebalanceAgent::run(const std::atomic<bool>& stop, bool once) {
    const auto poll = std::chrono::milliseconds(std::chrono::seconds(config_.poll_interval_seconds));
    std::optional<Timestamp> not_before;

    while (!stop.load(std::memory_order_acquire)) {
        auto checkpoint = load_or_initialize(std::chrono::system_clock::now());
        if (checkpoint.is_error()) {
            return forward_error<void>(checkpoint, "RebalanceAgent");
        }
        FundingScheduler scheduler(checkpoint.value());
        Logger::register_component("RebalanceAgent");

        Timestamp earliest = scheduler.earliest_next_funding(std::chrono::system_clock::now());
        if (not_before) {
            earliest = std::max(earliest, *not_before);
        }

        auto next = next_funding_time(earliest);
        if (next.is_error()) {
            return forward_error<void>(next, "RebalanceAgent");
        }

        INFO("Waiting until next trading time " << core::format_iso8601(next.value()));
        if (!core::wait_until(next.value(), poll, stop)) {
            break;
        }

        const Timestamp now = std::chrono::system_clock::now();
        auto report = run_cycle(scheduler, now);
        if (report.is_error()) {
            return forward_error<void>(report, "RebalanceAgent");
        }

        // A cycle that funded nothing must not repeat until the next day either
        not_before = core::next_eastern_midnight(now);

        if (once) {
            break;
        }
    }

    INFO("Agent stopped");
    return Result<void>();
}

}  // namespace rebalancer
