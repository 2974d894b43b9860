// asset_backtest_test.cpp — end-to-end tests over rule tables and a data file on disk

#include <gtest/gtest.h>

#include "config/simulation_config.hpp"
#include "engine/asset_backtest.hpp"
#include "engine/walk_forward_run.hpp"
#include "test_helpers.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

using test_helpers::RuleRow;
using test_helpers::rule_table;
using test_helpers::TempDir;
using test_helpers::write_text;

// A is active on every row, B never. X after the 2021 start: 0.4, -0.5, 0.6.
const char* EURUSD_DATA =
    "A,B,X,T\n"
    "1,0,0.1,2020-12-30\n"
    "1,0,0.2,2020-12-31\n"
    "1,0,0.3,2021-01-04\n"
    "1,0,0.4,2021-01-05\n"
    "1,0,-0.5,2021-01-06\n"
    "1,0,0.6,2021-01-07\n";

class AssetBacktestTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.rules_root = (dir.path() / "rules").string();
        cfg.data_root = (dir.path() / "data").string();
        cfg.output_dir = (dir.path() / "results").string();
        cfg.spread = 0.0;
        cfg.commission = 0.0;
        cfg.slippage = 0.0;

        write_rules("EURUSD", {RuleRow{"A(t-0)", "0", "0", 0.2, 10},
                               RuleRow{"A(t-1)", "0", "0", 0.1, 5}},
                    {RuleRow{"B(t-0)", "0", "0", -0.2, 8}});
        write_text(dir.path() / "data" / "EURUSD.txt", EURUSD_DATA);
    }

    void write_rules(const std::string& asset, const std::vector<RuleRow>& positive,
                     const std::vector<RuleRow>& negative) {
        RuleStore store(cfg.rules_root);
        write_text(store.rule_path(asset, Direction::POSITIVE), rule_table(positive));
        write_text(store.rule_path(asset, Direction::NEGATIVE), rule_table(negative));
    }

    TempDir dir;
    SimulationConfig cfg;
};

}  // namespace

// ===========================================================================
// Single test period
// ===========================================================================

TEST_F(AssetBacktestTest, TradesOnlyFromTestStart) {
    auto run = run_asset_backtest("EURUSD", cfg);
    ASSERT_FALSE(run.skipped) << run.skip_reason;

    EXPECT_EQ(run.series_rows, 6);
    EXPECT_EQ(run.rules.positive_count, 2);
    EXPECT_EQ(run.rules.negative_count, 1);
    EXPECT_EQ(run.window.begin, 2);
    EXPECT_EQ(run.signal_count, 3);

    const auto& r = run.result;
    ASSERT_EQ(r.total_trades, 3);
    EXPECT_EQ(r.buy_trades, 3);
    EXPECT_EQ(r.sell_trades, 0);
    EXPECT_EQ(r.trades.front().entry_idx, 2);
    EXPECT_EQ(r.trades.back().exit_idx, 5);
    EXPECT_NEAR(r.total_return, 0.5, 1e-12);
    for (const auto& t : r.trades) EXPECT_EQ(t.rule_id, 0);  // highest support wins
}

TEST_F(AssetBacktestTest, NoDedupKeepsEveryMatch) {
    cfg.deduplicate = false;
    auto run = run_asset_backtest("EURUSD", cfg);
    ASSERT_FALSE(run.skipped);
    EXPECT_EQ(run.signal_count, 6);
    EXPECT_EQ(run.result.total_trades, 6);
}

TEST_F(AssetBacktestTest, DefaultCostsApplied) {
    SimulationConfig with_costs = cfg;
    with_costs.spread = 0.0002;
    with_costs.commission = 0.0001;
    with_costs.slippage = 0.0001;
    auto run = run_asset_backtest("EURUSD", with_costs);
    ASSERT_FALSE(run.skipped);
    EXPECT_NEAR(run.result.total_return, 0.5 - 3 * 0.04, 1e-9);
    EXPECT_NEAR(run.result.total_return_before_cost, 0.5, 1e-12);
}

TEST_F(AssetBacktestTest, TopNLimitsRules) {
    cfg.top_n_rules = 1;
    auto run = run_asset_backtest("EURUSD", cfg);
    EXPECT_EQ(run.rules.positive_count, 1);
}

TEST_F(AssetBacktestTest, MissingAssetSkipped) {
    auto run = run_asset_backtest("GBPUSD", cfg);
    EXPECT_TRUE(run.skipped);
    EXPECT_NE(run.skip_reason.find("Input file not found"), std::string::npos);
}

TEST_F(AssetBacktestTest, MissingDataFileSkipped) {
    write_rules("USDJPY", {RuleRow{"A(t-0)"}}, {RuleRow{"B(t-0)"}});
    auto run = run_asset_backtest("USDJPY", cfg);
    EXPECT_TRUE(run.skipped);
    EXPECT_NE(run.skip_reason.find("USDJPY.txt"), std::string::npos);
}

TEST_F(AssetBacktestTest, EmptyRuleTablesSkipped) {
    write_rules("EURUSD", {}, {});
    auto run = run_asset_backtest("EURUSD", cfg);
    EXPECT_TRUE(run.skipped);
    EXPECT_EQ(run.skip_reason, "No rules loaded");
}

TEST_F(AssetBacktestTest, TestStartAfterDataSkipped) {
    cfg.test_start_date = "2030-01-01";
    auto run = run_asset_backtest("EURUSD", cfg);
    EXPECT_TRUE(run.skipped);
    EXPECT_EQ(run.skip_reason, "No signals generated");
}

TEST_F(AssetBacktestTest, MalformedDataThrows) {
    write_text(dir.path() / "data" / "EURUSD.txt", "A,B,X,T\n1,0,abc,2021-01-04\n");
    EXPECT_THROW(run_asset_backtest("EURUSD", cfg), std::runtime_error);
}

// ===========================================================================
// Walk-forward
// ===========================================================================

TEST_F(AssetBacktestTest, WalkForwardPerYear) {
    cfg.start_year = 2019;
    cfg.end_year = 2022;
    cfg.train_years = 1;
    auto run = run_asset_walk_forward("EURUSD", cfg);
    ASSERT_FALSE(run.skipped) << run.skip_reason;
    ASSERT_EQ(run.periods.size(), 3u);  // 2020, 2021, 2022

    // 2020 has a single entry row, which the lag-1 rule leaves unscannable.
    EXPECT_EQ(run.periods[0].status, PeriodStatus::NO_SIGNALS);
    EXPECT_TRUE(run.periods[1].completed());
    EXPECT_EQ(run.periods[1].result.total_trades, 3);
    EXPECT_NEAR(run.periods[1].result.total_return, 0.5, 1e-12);
    EXPECT_EQ(run.periods[2].status, PeriodStatus::NO_DATA);

    ASSERT_TRUE(run.aggregate.has_value());
    EXPECT_EQ(run.aggregate->total_periods, 1);
    EXPECT_EQ(run.aggregate->skipped_periods, 2);
    EXPECT_NEAR(run.aggregate->total_return, 0.5, 1e-12);
    ASSERT_TRUE(run.assessment.has_value());
    EXPECT_EQ(run.assessment->consistency_rating, "Excellent");
}

TEST_F(AssetBacktestTest, WalkForwardWithoutCompletedPeriods) {
    cfg.start_year = 2000;
    cfg.end_year = 2005;
    auto run = run_asset_walk_forward("EURUSD", cfg);
    EXPECT_FALSE(run.skipped);
    EXPECT_FALSE(run.aggregate.has_value());
    EXPECT_FALSE(run.assessment.has_value());
}

TEST_F(AssetBacktestTest, WalkForwardMissingAssetSkipped) {
    auto run = run_asset_walk_forward("AUDUSD", cfg);
    EXPECT_TRUE(run.skipped);
    EXPECT_TRUE(run.periods.empty());
}
