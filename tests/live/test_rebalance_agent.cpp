#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include "../core/test_base.hpp"
#include "fake_broker.hpp"
#include "rebalancer/core/time_utils.hpp"
#include "rebalancer/live/rebalance_agent.hpp"

namespace rebalancer {

using ::testing::ElementsAre;
using ::testing::Pair;

class RebalanceAgentTest : public testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        test_dir = std::filesystem::temp_directory_path() / "rebalancer_agent_test";
        std::filesystem::remove_all(test_dir);
        std::filesystem::create_directories(test_dir);

        config.checkpoint_path = (test_dir / "state.json").string();
        config.poll_interval_seconds = 1;
        store = std::make_unique<CheckpointStore>(config.checkpoint_path);

        broker.positions = {{"SPY", 0.0, 10.0}, {"QQQ", 0.0, 25.0}};
        broker.sessions = {{"2020-01-02", "09:30", "16:00"}};
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
        TestBase::TearDown();
    }

    Checkpoint checkpoint_finishing_in(Days days) const {
        Checkpoint checkpoint;
        checkpoint.ideal_allocations = {{"SPY", 1.0}, {"QQQ", 0.0}};
        checkpoint.reference_equities = {{"SPY", 0.0}, {"QQQ", 0.0}};
        checkpoint.target_investment_equity_ratio = 1.0;
        checkpoint.finish_date = now + days;
        return checkpoint;
    }

    static Timestamp utc(int year, int month, int day, int hour, int minute) {
        std::tm t{};
        t.tm_year = year - 1900;
        t.tm_mon = month - 1;
        t.tm_mday = day;
        t.tm_hour = hour;
        t.tm_min = minute;
        return std::chrono::system_clock::from_time_t(core::safe_timegm(&t));
    }

    std::filesystem::path test_dir;
    AgentConfig config;
    testing::FakeBroker broker;
    std::unique_ptr<CheckpointStore> store;
    Timestamp now = std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::system_clock::now());
};

TEST_F(RebalanceAgentTest, InitializesMissingCheckpointFromPositions) {
    broker.positions = {{"AAPL", 300.0, 150.0}, {"MSFT", 100.0, 400.0}};
    RebalanceAgent agent(config, broker, *store);

    auto checkpoint = agent.load_or_initialize(now);
    ASSERT_TRUE(checkpoint.is_ok()) << checkpoint.error()->what();
    EXPECT_FALSE(checkpoint.value().last_funding_date.has_value());
    EXPECT_THAT(checkpoint.value().ideal_allocations,
                ElementsAre(Pair("AAPL", 0.75), Pair("MSFT", 0.25)));
    EXPECT_EQ(checkpoint.value().finish_date, now + Days(365));
    EXPECT_DOUBLE_EQ(checkpoint.value().target_investment_equity_ratio, 1.0);

    ASSERT_TRUE(store->exists());
    auto reloaded = store->load();
    ASSERT_TRUE(reloaded.is_ok());
    EXPECT_EQ(reloaded.value().ideal_allocations, checkpoint.value().ideal_allocations);
}

TEST_F(RebalanceAgentTest, InitializationUsesConfiguredDefaults) {
    config.default_target_ratio = 0.6;
    config.default_horizon_days = 30;
    RebalanceAgent agent(config, broker, *store);

    auto checkpoint = agent.load_or_initialize(now);
    ASSERT_TRUE(checkpoint.is_ok());
    EXPECT_DOUBLE_EQ(checkpoint.value().target_investment_equity_ratio, 0.6);
    EXPECT_EQ(checkpoint.value().finish_date, now + Days(30));
}

TEST_F(RebalanceAgentTest, LoadsExistingCheckpoint) {
    Checkpoint existing = checkpoint_finishing_in(Days(50));
    existing.last_funding_date = now - Days(1);
    ASSERT_TRUE(store->save(existing).is_ok());

    RebalanceAgent agent(config, broker, *store);
    auto checkpoint = agent.load_or_initialize(now);
    ASSERT_TRUE(checkpoint.is_ok());
    EXPECT_EQ(checkpoint.value().last_funding_date, existing.last_funding_date);
    EXPECT_EQ(broker.position_calls, 0);
}

TEST_F(RebalanceAgentTest, ReinitializesUnreadableCheckpoint) {
    {
        std::ofstream file(config.checkpoint_path);
        file << "{ truncated";
    }
    RebalanceAgent agent(config, broker, *store);

    auto checkpoint = agent.load_or_initialize(now);
    ASSERT_TRUE(checkpoint.is_ok());
    EXPECT_EQ(broker.position_calls, 1);
    EXPECT_TRUE(store->load().is_ok());
}

TEST_F(RebalanceAgentTest, InitializationFailsWithoutPositions) {
    broker.fail_positions = true;
    RebalanceAgent agent(config, broker, *store);

    auto checkpoint = agent.load_or_initialize(now);
    ASSERT_TRUE(checkpoint.is_error());
    EXPECT_EQ(checkpoint.error()->code(), ErrorCode::API_ERROR);
    EXPECT_FALSE(store->exists());
}

TEST_F(RebalanceAgentTest, NextFundingTimeQueriesEasternDate) {
    broker.sessions = {{"2024-01-02", "09:30", "16:00"}, {"2024-01-03", "09:30", "16:00"}};
    RebalanceAgent agent(config, broker, *store);

    auto next = agent.next_funding_time(utc(2024, 1, 2, 12, 0));
    ASSERT_TRUE(next.is_ok()) << next.error()->what();
    EXPECT_EQ(core::format_iso8601(next.value()), "2024-01-02T15:30:00Z");
    ASSERT_EQ(broker.calendar_requests.size(), 1u);
    EXPECT_EQ(broker.calendar_requests[0].first, "2024-01-02");
    EXPECT_EQ(broker.calendar_requests[0].second, "2024-01-09");
}

TEST_F(RebalanceAgentTest, NextFundingTimeUsesNewYorkDateLateInTheDay) {
    broker.sessions = {{"2024-12-31", "09:30", "16:00"}};
    RebalanceAgent agent(config, broker, *store);

    // 02:00 UTC on Jan 1 is still Dec 31 in New York
    auto next = agent.next_funding_time(utc(2025, 1, 1, 2, 0));
    ASSERT_TRUE(next.is_ok());
    EXPECT_EQ(broker.calendar_requests[0].first, "2024-12-31");
    EXPECT_EQ(broker.calendar_requests[0].second, "2025-01-07");
}

TEST_F(RebalanceAgentTest, NextFundingTimeWithoutSessions) {
    broker.sessions.clear();
    RebalanceAgent agent(config, broker, *store);

    auto next = agent.next_funding_time(now);
    ASSERT_TRUE(next.is_error());
    EXPECT_EQ(next.error()->code(), ErrorCode::MARKET_DATA_ERROR);
}

TEST_F(RebalanceAgentTest, CycleSubmitsPlanThenAdvancesCheckpoint) {
    broker.set_account(1000.0, 1000.0, 1000.0);  // 10 a day over 100 days
    RebalanceAgent agent(config, broker, *store);
    FundingScheduler scheduler(checkpoint_finishing_in(Days(100)));

    auto report = agent.run_cycle(scheduler, now);
    ASSERT_TRUE(report.is_ok()) << report.error()->what();

    EXPECT_TRUE(report.value().funded);
    EXPECT_DOUBLE_EQ(report.value().decision.funding_today, 10.0);
    ASSERT_EQ(report.value().plan.purchases.size(), 1u);
    EXPECT_EQ(report.value().plan.purchases[0].asset_index, 0u);

    ASSERT_EQ(broker.submitted.size(), 1u);
    EXPECT_EQ(broker.submitted[0].symbol, "SPY");
    EXPECT_EQ(broker.submitted[0].quantity, 1);
    EXPECT_EQ(broker.submitted[0].limit_price_cents, 999);

    EXPECT_EQ(scheduler.checkpoint().last_funding_date, now);
    auto saved = store->load();
    ASSERT_TRUE(saved.is_ok());
    EXPECT_EQ(saved.value().last_funding_date, now);
}

TEST_F(RebalanceAgentTest, ConsecutiveDaysFundEvenWithEarlierWakeUp) {
    broker.set_account(1000.0, 1000.0, 1000.0);
    RebalanceAgent agent(config, broker, *store);
    Timestamp monday = utc(2024, 1, 8, 15, 30) + std::chrono::milliseconds(800);
    Timestamp tuesday = utc(2024, 1, 9, 15, 30) + std::chrono::milliseconds(200);
    Checkpoint checkpoint = checkpoint_finishing_in(Days(0));
    checkpoint.finish_date = monday + Days(100);
    FundingScheduler scheduler(checkpoint);

    auto first = agent.run_cycle(scheduler, monday);
    ASSERT_TRUE(first.is_ok()) << first.error()->what();
    EXPECT_TRUE(first.value().funded);

    auto second = agent.run_cycle(scheduler, tuesday);
    ASSERT_TRUE(second.is_ok()) << second.error()->what();
    EXPECT_EQ(second.value().decision.days_elapsed, 1);
    EXPECT_TRUE(second.value().funded);
    EXPECT_EQ(broker.submitted.size(), 2u);
    EXPECT_EQ(scheduler.checkpoint().last_funding_date, tuesday);
}

TEST_F(RebalanceAgentTest, WeekendAcrossDaylightSavingFundsThreeDays) {
    broker.set_account(1000.0, 1000.0, 1000.0);
    RebalanceAgent agent(config, broker, *store);
    Timestamp friday = utc(2024, 3, 8, 15, 30) + std::chrono::milliseconds(900);
    Timestamp monday = utc(2024, 3, 11, 14, 30) + std::chrono::milliseconds(100);
    Checkpoint checkpoint = checkpoint_finishing_in(Days(0));
    checkpoint.finish_date = friday + Days(100);
    FundingScheduler scheduler(checkpoint);

    ASSERT_TRUE(agent.run_cycle(scheduler, friday).is_ok());
    ASSERT_EQ(broker.submitted.size(), 1u);

    auto report = agent.run_cycle(scheduler, monday);
    ASSERT_TRUE(report.is_ok()) << report.error()->what();
    EXPECT_EQ(report.value().decision.days_elapsed, 3);
    EXPECT_NEAR(report.value().decision.funding_today,
                3.0 * report.value().decision.daily_funding, 1e-9);
    EXPECT_EQ(report.value().plan.purchases.size(), 3u);
    EXPECT_EQ(broker.submitted.size(), 4u);
}

TEST_F(RebalanceAgentTest, RejectedOrderLeavesCheckpointUntouched) {
    broker.set_account(1000.0, 1000.0, 1000.0);
    broker.reject_from_attempt = 2;
    Checkpoint checkpoint = checkpoint_finishing_in(Days(100));
    checkpoint.last_funding_date = now - Days(3);  // 30 to fund: three SPY purchases
    ASSERT_TRUE(store->save(checkpoint).is_ok());

    RebalanceAgent agent(config, broker, *store);
    FundingScheduler scheduler(checkpoint);

    auto report = agent.run_cycle(scheduler, now);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error()->code(), ErrorCode::ORDER_REJECTED);
    EXPECT_EQ(broker.submitted.size(), 1u);

    EXPECT_EQ(scheduler.checkpoint().last_funding_date, checkpoint.last_funding_date);
    auto saved = store->load();
    ASSERT_TRUE(saved.is_ok());
    EXPECT_EQ(saved.value().last_funding_date, checkpoint.last_funding_date);
}

TEST_F(RebalanceAgentTest, NothingToFundIsNoOp) {
    broker.set_account(1000.0, 0.0, 0.0);
    RebalanceAgent agent(config, broker, *store);
    FundingScheduler scheduler(checkpoint_finishing_in(Days(100)));

    auto report = agent.run_cycle(scheduler, now);
    ASSERT_TRUE(report.is_ok());
    EXPECT_FALSE(report.value().funded);
    EXPECT_FALSE(report.value().decision.should_fund());
    EXPECT_EQ(broker.position_calls, 0);
    EXPECT_EQ(broker.submit_attempts, 0);
    EXPECT_FALSE(scheduler.checkpoint().last_funding_date.has_value());
    EXPECT_FALSE(store->exists());
}

TEST_F(RebalanceAgentTest, FundingBelowCheapestPriceStillAdvances) {
    broker.set_account(1000.0, 500.0, 500.0);  // 5 a day, every asset costs more
    RebalanceAgent agent(config, broker, *store);
    FundingScheduler scheduler(checkpoint_finishing_in(Days(100)));

    auto report = agent.run_cycle(scheduler, now);
    ASSERT_TRUE(report.is_ok());
    EXPECT_TRUE(report.value().plan.purchases.empty());
    EXPECT_EQ(broker.submit_attempts, 0);
    EXPECT_TRUE(report.value().funded);
    EXPECT_EQ(scheduler.checkpoint().last_funding_date, now);
}

TEST_F(RebalanceAgentTest, PreconditionViolationStopsCycle) {
    broker.set_account(1000.0, 1000.0, 1000.0);
    RebalanceAgent agent(config, broker, *store);
    FundingScheduler scheduler(checkpoint_finishing_in(Days(0)));

    auto report = agent.run_cycle(scheduler, now);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error()->code(), ErrorCode::PRECONDITION_VIOLATION);
    EXPECT_EQ(broker.submit_attempts, 0);
}

TEST_F(RebalanceAgentTest, InsufficientBuyingPowerStopsCycle) {
    broker.set_account(1000.0, 1000.0, 1.0);
    RebalanceAgent agent(config, broker, *store);
    FundingScheduler scheduler(checkpoint_finishing_in(Days(100)));

    auto report = agent.run_cycle(scheduler, now);
    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error()->code(), ErrorCode::INSUFFICIENT_FUNDS);
}

TEST_F(RebalanceAgentTest, RunOnceFromScratch) {
    broker.positions = {{"SPY", 100.0, 10.0}};
    broker.set_account(10000.0, 9900.0, 9900.0);  // About 27 a day over a year
    RebalanceAgent agent(config, broker, *store);
    std::atomic<bool> stop{false};

    auto result = agent.run(stop, true);
    ASSERT_TRUE(result.is_ok()) << result.error()->what();

    EXPECT_EQ(broker.calendar_requests.size(), 1u);
    ASSERT_EQ(broker.submitted.size(), 2u);
    EXPECT_EQ(broker.submitted[0].symbol, "SPY");

    auto saved = store->load();
    ASSERT_TRUE(saved.is_ok());
    EXPECT_TRUE(saved.value().last_funding_date.has_value());
    EXPECT_DOUBLE_EQ(saved.value().ideal_fraction("SPY"), 1.0);
}

TEST_F(RebalanceAgentTest, RunReturnsCycleError) {
    ASSERT_TRUE(store->save(checkpoint_finishing_in(Days(100))).is_ok());
    broker.fail_account = true;
    RebalanceAgent agent(config, broker, *store);
    std::atomic<bool> stop{false};

    auto result = agent.run(stop, false);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONNECTION_ERROR);
    EXPECT_EQ(broker.account_calls, 1);
}

TEST_F(RebalanceAgentTest, RunHonoursStopBeforeStarting) {
    RebalanceAgent agent(config, broker, *store);
    std::atomic<bool> stop{true};

    auto result = agent.run(stop, false);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(broker.account_calls, 0);
    EXPECT_EQ(broker.position_calls, 0);
}

}  // namespace rebalancer
