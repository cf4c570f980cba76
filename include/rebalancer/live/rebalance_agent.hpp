// include/rebalancer/live/rebalance_agent.hpp
// Drives the daily funding cycle: checkpoint, calendar wait, scheduler, planner, orders

#pragma once

#include <atomic>
#include <optional>
#include <vector>
#include "rebalancer/allocation/allocation_planner.hpp"
#include "rebalancer/broker/broker_interface.hpp"
#include "rebalancer/core/error.hpp"
#include "rebalancer/core/types.hpp"
#include "rebalancer/funding/checkpoint_store.hpp"
#include "rebalancer/funding/funding_scheduler.hpp"
#include "rebalancer/live/agent_config.hpp"
#include "rebalancer/live/order_executor.hpp"

namespace rebalancer {

/**
 * @brief Outcome of one funding cycle
 */
struct CycleReport {
    FundingDecision decision;
    std::vector<PositionSnapshot> positions;  // Empty when the cycle was a no-op
    PurchasePlan plan;
    ExecutionSummary execution;
    bool funded{false};  // Orders submitted and checkpoint advanced
};

class RebalanceAgent {
public:
    /**
     * @param config Agent settings
     * @param broker Account, positions, calendar and order access
     * @param store Where the checkpoint lives
     */
    RebalanceAgent(AgentConfig config, BrokerInterface& broker, CheckpointStore& store);

    /**
     * @brief Load the checkpoint, creating it from live positions when none is loadable
     */
    Result<Checkpoint> load_or_initialize(Timestamp now);

    /**
     * @brief Funding instant of the first trading session on or after `earliest`
     * The calendar is queried for the Eastern date of `earliest` plus the lookahead.
     */
    Result<Timestamp> next_funding_time(Timestamp earliest);

    /**
     * @brief Run one funding cycle at `now`
     *
     * A failure at any step returns the error and leaves the checkpoint untouched,
     * including a submission failure part way through the plan.
     */
    Result<CycleReport> run_cycle(FundingScheduler& scheduler, Timestamp now);

    /**
     * @brief Repeat load, wait, cycle until stop is raised
     * @param stop Raised by the host to end the loop between cycles or during a wait
     * @param once Return after the first cycle
     */
    Result<void> run(const std::atomic<bool>& stop, bool once = false);

private:
    AgentConfig config_;
    BrokerInterface& broker_;
    CheckpointStore& store_;
    AllocationPlanner planner_;
    OrderExecutor executor_;
};

}  // namespace rebalancer
