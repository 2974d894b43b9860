// backtest_result_io_test.cpp — tests for CSV and JSON report output

#include <gtest/gtest.h>

#include "backtest/backtest_result_io.hpp"
#include "backtest/rule_performance.hpp"
#include "backtest/success_criteria.hpp"
#include "backtest/walk_forward.hpp"
#include "portfolio/portfolio_io.hpp"
#include "test_helpers.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace {

using test_helpers::make_trades;
using test_helpers::TempDir;

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) out.push_back(line);
    return out;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

// ===========================================================================
// Escaping
// ===========================================================================

TEST(BacktestIoTest, JsonEscape) {
    EXPECT_EQ(backtest_io::json_escape("a\"b\\c\n"), "a\\\"b\\\\c\\n");
    EXPECT_EQ(backtest_io::json_escape("plain"), "plain");
}

TEST(BacktestIoTest, CsvFieldQuotesOnlyWhenNeeded) {
    EXPECT_EQ(backtest_io::csv_field("Attr1(t-0)"), "Attr1(t-0)");
    EXPECT_EQ(backtest_io::csv_field("a,b"), "\"a,b\"");
    EXPECT_EQ(backtest_io::csv_field("say \"hi\""), "\"say \"\"hi\"\"\"");
}

// ===========================================================================
// CSV
// ===========================================================================

TEST(BacktestIoTest, TradesCsvHasHeaderAndOneLinePerTrade) {
    auto trades = make_trades({{"2021-01-04", 1.5}, {"2021-01-05", -0.5}});
    trades[1].side = Side::SELL;
    trades[1].rule_text = "A(t-1) AND B(t-2)";
    auto lines = lines_of(backtest_io::trades_csv(trades));

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].rfind("entry_t,exit_t,entry_date,signal,rule_id,rule_text", 0), 0u);
    EXPECT_TRUE(contains(lines[1], ",BUY,"));
    EXPECT_TRUE(contains(lines[2], ",SELL,"));
    EXPECT_TRUE(contains(lines[2], "A(t-1) AND B(t-2)"));
}

TEST(BacktestIoTest, RulePerformanceCsv) {
    std::vector<RulePerformance> stats(1);
    stats[0].rule_id = 4;
    stats[0].side = Side::SELL;
    stats[0].rule_text = "X(t-1)";
    stats[0].trade_count = 2;
    stats[0].wins = 1;
    stats[0].total_return = 1.25;
    auto lines = lines_of(backtest_io::rule_performance_csv(stats));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "rule_id,signal,rule_text,trade_count,total_return,avg_profit,wins,win_rate");
    EXPECT_EQ(lines[1].rfind("4,SELL,X(t-1),2,1.25,", 0), 0u);
}

TEST(BacktestIoTest, PeriodsCsvIncludesSkippedPeriods) {
    std::vector<PeriodResult> periods(2);
    periods[0].period = Period{1, 2015, 20100101, 20141231, 20150101, 20151231};
    periods[0].status = PeriodStatus::COMPLETED;
    periods[0].result.total_trades = 3;
    periods[1].period = Period{2, 2016, 20110101, 20151231, 20160101, 20161231};
    periods[1].status = PeriodStatus::NO_SIGNALS;

    auto lines = lines_of(backtest_io::periods_csv(periods));
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1].rfind("1,2015,2010-01-01,2014-12-31,2015-01-01,2015-12-31,COMPLETED,3,", 0),
              0u);
    EXPECT_TRUE(contains(lines[2], ",NO_SIGNALS,"));
}

// ===========================================================================
// JSON
// ===========================================================================

TEST(BacktestIoTest, ResultJsonWithAndWithoutTrades) {
    BacktestResult r{};
    r.trades = make_trades({{"2021-01-04", 2.0}});
    backtest_util::recompute_derived(r);

    auto with = backtest_io::to_json(r);
    EXPECT_TRUE(contains(with, "\"total_trades\":1"));
    EXPECT_TRUE(contains(with, "\"trades\":[{"));
    EXPECT_TRUE(contains(with, "\"entry_date\":\"2021-01-04\""));

    auto without = backtest_io::to_json(r, false);
    EXPECT_FALSE(contains(without, "\"trades\""));
    EXPECT_EQ(without.front(), '{');
    EXPECT_EQ(without.back(), '}');
}

TEST(BacktestIoTest, WalkForwardJson) {
    std::vector<PeriodResult> periods(2);
    periods[0].period.index = 1;
    periods[0].status = PeriodStatus::COMPLETED;
    periods[0].result.total_return = 1.0;
    periods[1].period.index = 2;
    periods[1].status = PeriodStatus::NO_DATA;
    periods[1].skip_reason = "No rows in test period";

    auto agg = WalkForwardRunner::aggregate(periods);
    ASSERT_TRUE(agg.has_value());
    auto assessment = RobustnessCriteria{}.evaluate(*agg);

    auto json = backtest_io::to_json(periods, agg, assessment);
    EXPECT_TRUE(contains(json, "\"status\":\"COMPLETED\""));
    EXPECT_TRUE(contains(json, "\"skip_reason\":\"No rows in test period\""));
    EXPECT_TRUE(contains(json, "\"total_periods\":1"));
    EXPECT_TRUE(contains(json, "\"skipped_periods\":1"));
    EXPECT_TRUE(contains(json, "\"verdict\":\"MARGINAL\""));

    auto no_agg = backtest_io::to_json(periods, std::nullopt, std::nullopt);
    EXPECT_TRUE(contains(no_agg, "\"aggregate\":null"));
    EXPECT_FALSE(contains(no_agg, "\"assessment\""));
}

TEST(BacktestIoTest, PortfolioJsonUndefined) {
    PortfolioResult r{};
    r.excluded.push_back({"EURUSD", "No trades"});
    auto json = portfolio_io::to_json(r);
    EXPECT_TRUE(contains(json, "\"defined\":false"));
    EXPECT_TRUE(contains(json, "\"reason\":\"No trades\""));
    EXPECT_FALSE(contains(json, "\"portfolio\""));
}

TEST(BacktestIoTest, PortfolioCsvs) {
    std::vector<AssetTrades> inputs{{"A", make_trades({{"2021-01-04", 1.0}})},
                                    {"B", make_trades({{"2021-01-05", 2.0}})}};
    auto r = PortfolioAggregator(AllocationStrategy::EQUAL_WEIGHT).aggregate(inputs);
    ASSERT_TRUE(r.defined);

    auto equity = lines_of(portfolio_io::equity_curve_csv(r.equity_curve));
    ASSERT_EQ(equity.size(), 3u);
    EXPECT_EQ(equity[0], "timestamp,equity");

    auto metrics = lines_of(portfolio_io::asset_metrics_csv(r));
    ASSERT_EQ(metrics.size(), 3u);
    EXPECT_EQ(metrics[1].rfind("A,0.5,", 0), 0u);

    auto corr = lines_of(portfolio_io::correlation_csv(r.correlation));
    ASSERT_EQ(corr.size(), 3u);
    EXPECT_EQ(corr[0], "asset,A,B");
    EXPECT_EQ(corr[1].rfind("A,1,", 0), 0u);

    auto json = portfolio_io::to_json(r);
    EXPECT_TRUE(contains(json, "\"defined\":true"));
    EXPECT_TRUE(contains(json, "\"allocation_strategy\":\"equal_weight\""));
    EXPECT_TRUE(contains(json, "\"grade\":\"POOR\""));
}

// ===========================================================================
// write_file
// ===========================================================================

TEST(BacktestIoTest, WriteFileCreatesParentDirectories) {
    TempDir dir;
    auto path = dir.path() / "nested" / "deeper" / "out.txt";
    backtest_io::write_file(path.string(), "hello\n");
    EXPECT_EQ(test_helpers::read_text(path), "hello\n");
}

TEST(BacktestIoTest, WriteFileFailureThrows) {
    TempDir dir;
    // A directory cannot be opened as an output file.
    EXPECT_THROW(backtest_io::write_file(dir.str(), "x"), std::runtime_error);
}
