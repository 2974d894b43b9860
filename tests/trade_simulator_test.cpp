// trade_simulator_test.cpp — tests for TradeSimulator and BacktestResult stats
//
// One-period trades, side sign convention, cost deduction, running
// cumulative return, summary statistics and the per-rule breakdown.

#include <gtest/gtest.h>

#include "backtest/execution_costs.hpp"
#include "backtest/rule_performance.hpp"
#include "backtest/signal.hpp"
#include "backtest/trade_simulator.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <vector>

namespace {

using test_helpers::make_series;

Signal make_signal(int t, Side side, int rule_id = 0, int support = 10) {
    Signal s{};
    s.t = t;
    s.side = side;
    s.direction = side == Side::BUY ? Direction::POSITIVE : Direction::NEGATIVE;
    s.rule_id = rule_id;
    s.support_count = support;
    return s;
}

ExecutionCosts zero_costs() {
    return ExecutionCosts{0.0, 0.0, 0.0};
}

// X = [0, 1.0, -0.5, 2.0, -1.0]
TimeSeries five_rows() {
    return make_series({{"ON", {1, 1, 1, 1, 1}}}, {0.0, 1.0, -0.5, 2.0, -1.0});
}

// BUY@0 -> +1.0, SELL@1 -> +0.5, BUY@2 -> +2.0, BUY@3 -> -1.0
std::vector<Signal> four_signals() {
    return {make_signal(0, Side::BUY, 1), make_signal(1, Side::SELL, 2),
            make_signal(2, Side::BUY, 1), make_signal(3, Side::BUY, 3)};
}

}  // namespace

// ===========================================================================
// 1. Per-trade identities
// ===========================================================================

TEST(TradeSimulatorTest, CostReducesBuyProfit) {
    // Default costs total 0.0004 as a fraction, 0.04 in percent points.
    auto s = make_series({{"ON", {1, 1}}}, {0.0, 0.05});
    TradeSimulator sim(ExecutionCosts{0.0002, 0.0001, 0.0001});
    auto trades = sim.simulate({make_signal(0, Side::BUY)}, s);

    ASSERT_EQ(trades.size(), 1u);
    EXPECT_DOUBLE_EQ(trades[0].actual_x, 0.05);
    EXPECT_DOUBLE_EQ(trades[0].gross_profit, 0.05);
    EXPECT_NEAR(trades[0].transaction_cost, 0.04, 1e-12);
    EXPECT_NEAR(trades[0].net_profit, 0.01, 1e-12);
    EXPECT_TRUE(trades[0].win);
}

TEST(TradeSimulatorTest, ExitIsNextRowAndInsideSeries) {
    auto s = five_rows();
    TradeSimulator sim(zero_costs());
    auto trades = sim.simulate(four_signals(), s);
    ASSERT_EQ(trades.size(), 4u);
    for (const auto& t : trades) {
        EXPECT_EQ(t.exit_idx, t.entry_idx + 1);
        EXPECT_LT(t.exit_idx, s.size());
        EXPECT_DOUBLE_EQ(t.actual_x, s.x(t.exit_idx));
    }
}

TEST(TradeSimulatorTest, GrossProfitSignFollowsSide) {
    auto s = five_rows();
    TradeSimulator sim(ExecutionCosts{});
    auto trades = sim.simulate(four_signals(), s);
    for (const auto& t : trades) {
        if (t.side == Side::BUY) {
            EXPECT_EQ(t.gross_profit, t.actual_x);
        } else {
            EXPECT_EQ(t.gross_profit, -t.actual_x);
        }
        EXPECT_DOUBLE_EQ(t.net_profit, t.gross_profit - ExecutionCosts{}.round_trip_cost_pct());
        EXPECT_EQ(t.win, t.net_profit > 0.0);
    }
}

TEST(TradeSimulatorTest, CumulativeReturnIsRunningSum) {
    auto s = five_rows();
    TradeSimulator sim(ExecutionCosts{});
    auto trades = sim.simulate(four_signals(), s);
    ASSERT_FALSE(trades.empty());
    EXPECT_DOUBLE_EQ(trades[0].cumulative_return, trades[0].net_profit);
    for (size_t i = 1; i < trades.size(); ++i) {
        EXPECT_NEAR(trades[i].cumulative_return - trades[i - 1].cumulative_return,
                    trades[i].net_profit, 1e-12);
    }
}

TEST(TradeSimulatorTest, SignalWithoutOutcomeIsDropped) {
    auto s = five_rows();
    TradeSimulator sim(zero_costs());
    auto trades = sim.simulate({make_signal(4, Side::BUY), make_signal(2, Side::BUY)}, s);
    ASSERT_EQ(trades.size(), 1u);
    EXPECT_EQ(trades[0].entry_idx, 2);
}

TEST(TradeSimulatorTest, SignalsAreProcessedInRowOrder) {
    auto s = five_rows();
    TradeSimulator sim(zero_costs());
    auto trades = sim.simulate({make_signal(3, Side::BUY), make_signal(0, Side::BUY)}, s);
    ASSERT_EQ(trades.size(), 2u);
    EXPECT_EQ(trades[0].entry_idx, 0);
    EXPECT_EQ(trades[1].entry_idx, 3);
    EXPECT_DOUBLE_EQ(trades[1].cumulative_return, 0.0);  // +1.0 then -1.0
}

TEST(TradeSimulatorTest, EmptySignalsGiveEmptyResult) {
    auto s = five_rows();
    TradeSimulator sim(ExecutionCosts{});
    auto result = sim.run({}, s);
    EXPECT_TRUE(result.empty());
    EXPECT_EQ(result.total_trades, 0);
    EXPECT_DOUBLE_EQ(result.total_return, 0.0);
}

TEST(TradeSimulatorTest, NegativeCostsRejected) {
    EXPECT_THROW(TradeSimulator(ExecutionCosts{-0.1, 0.0, 0.0}), std::invalid_argument);
}

// ===========================================================================
// 2. Summary statistics
// ===========================================================================

TEST(TradeSimulatorTest, SummaryStatistics) {
    auto s = five_rows();
    TradeSimulator sim(zero_costs());
    auto r = sim.run(four_signals(), s);

    EXPECT_EQ(r.total_trades, 4);
    EXPECT_EQ(r.buy_trades, 3);
    EXPECT_EQ(r.sell_trades, 1);
    EXPECT_EQ(r.winning_trades, 3);
    EXPECT_EQ(r.losing_trades, 1);
    EXPECT_DOUBLE_EQ(r.win_rate, 0.75);
    EXPECT_DOUBLE_EQ(r.total_return, 2.5);
    EXPECT_DOUBLE_EQ(r.total_return_before_cost, 2.5);
    EXPECT_DOUBLE_EQ(r.avg_profit, 0.625);
    EXPECT_DOUBLE_EQ(r.avg_win, 3.5 / 3.0);
    EXPECT_DOUBLE_EQ(r.avg_loss, -1.0);
    EXPECT_DOUBLE_EQ(r.max_win, 2.0);
    EXPECT_DOUBLE_EQ(r.max_loss, -1.0);
    EXPECT_DOUBLE_EQ(r.final_cumulative_return, 2.5);
    EXPECT_DOUBLE_EQ(r.max_drawdown, -1.0);
    EXPECT_DOUBLE_EQ(r.profit_factor, 3.5);
    EXPECT_NEAR(r.sharpe, 0.5 * std::sqrt(252.0), 1e-9);

    EXPECT_DOUBLE_EQ(r.buy_total_return, 2.0);
    EXPECT_NEAR(r.buy_win_rate, 2.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(r.sell_total_return, 0.5);
    EXPECT_DOUBLE_EQ(r.sell_win_rate, 1.0);
}

TEST(TradeSimulatorTest, CostAppearsInBeforeAfterGap) {
    auto s = five_rows();
    TradeSimulator sim(ExecutionCosts{});
    auto r = sim.run(four_signals(), s);
    EXPECT_NEAR(r.total_return_before_cost - r.total_return, 4 * 0.04, 1e-12);
    EXPECT_NEAR(r.total_cost, 4 * 0.04, 1e-12);
}

TEST(TradeSimulatorTest, SharpeZeroForSingleTrade) {
    auto s = five_rows();
    TradeSimulator sim(zero_costs());
    auto r = sim.run({make_signal(0, Side::BUY)}, s);
    EXPECT_DOUBLE_EQ(r.sharpe, 0.0);
    EXPECT_DOUBLE_EQ(r.max_drawdown, 0.0);
    EXPECT_DOUBLE_EQ(r.profit_factor, 0.0);  // no losing trade
}

// ===========================================================================
// 3. backtest_util helpers
// ===========================================================================

TEST(BacktestUtilTest, DrawdownSeriesFromRunningPeak) {
    auto dd = backtest_util::drawdown_series({1.0, 3.0, 2.0, 5.0, 1.0});
    ASSERT_EQ(dd.size(), 5u);
    EXPECT_DOUBLE_EQ(dd[0], 0.0);
    EXPECT_DOUBLE_EQ(dd[1], 0.0);
    EXPECT_DOUBLE_EQ(dd[2], -1.0);
    EXPECT_DOUBLE_EQ(dd[3], 0.0);
    EXPECT_DOUBLE_EQ(dd[4], -4.0);
    EXPECT_DOUBLE_EQ(backtest_util::max_drawdown({1.0, 3.0, 2.0, 5.0, 1.0}), -4.0);
}

TEST(BacktestUtilTest, DrawdownStartsFromFirstValue) {
    EXPECT_DOUBLE_EQ(backtest_util::max_drawdown({-1.0, -2.0}), -1.0);
    EXPECT_DOUBLE_EQ(backtest_util::max_drawdown({}), 0.0);
}

TEST(BacktestUtilTest, StddevSampleAndPopulation) {
    std::vector<double> v{1.0, 2.0, 3.0, 4.0};
    EXPECT_NEAR(backtest_util::stddev(v, 1), std::sqrt(5.0 / 3.0), 1e-12);
    EXPECT_NEAR(backtest_util::stddev(v, 0), std::sqrt(1.25), 1e-12);
    EXPECT_DOUBLE_EQ(backtest_util::stddev({7.0}, 1), 0.0);
}

TEST(BacktestUtilTest, SharpeZeroForConstantReturns) {
    EXPECT_DOUBLE_EQ(backtest_util::annualized_sharpe({0.5, 0.5, 0.5}), 0.0);
}

// ===========================================================================
// 4. Per-rule breakdown
// ===========================================================================

TEST(RulePerformanceTest, GroupsByRuleAndSideSortedByReturn) {
    auto s = five_rows();
    TradeSimulator sim(zero_costs());
    auto trades = sim.simulate(four_signals(), s);
    auto stats = backtest_util::rule_performance(trades);

    // rule 1 BUY: +1.0 +2.0, rule 2 SELL: +0.5, rule 3 BUY: -1.0
    ASSERT_EQ(stats.size(), 3u);
    EXPECT_EQ(stats[0].rule_id, 1);
    EXPECT_EQ(stats[0].trade_count, 2);
    EXPECT_DOUBLE_EQ(stats[0].total_return, 3.0);
    EXPECT_DOUBLE_EQ(stats[0].avg_profit, 1.5);
    EXPECT_DOUBLE_EQ(stats[0].win_rate, 1.0);
    EXPECT_EQ(stats[1].rule_id, 2);
    EXPECT_EQ(stats[1].side, Side::SELL);
    EXPECT_EQ(stats[2].rule_id, 3);
    EXPECT_EQ(stats[2].wins, 0);
}

TEST(RulePerformanceTest, SameIdDifferentSideAreSeparate) {
    auto s = five_rows();
    TradeSimulator sim(zero_costs());
    auto trades = sim.simulate({make_signal(0, Side::BUY, 7), make_signal(1, Side::SELL, 7)}, s);
    EXPECT_EQ(backtest_util::rule_performance(trades).size(), 2u);
}
