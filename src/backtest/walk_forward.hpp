#pragma once

#include "backtest/execution_costs.hpp"
#include "backtest/signal_generator.hpp"
#include "backtest/trade_simulator.hpp"
#include "data/time_series.hpp"
#include "logging.hpp"
#include "rules/rule.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// WalkForwardConfig — rolling train/test schedule in whole calendar years
// ---------------------------------------------------------------------------
struct WalkForwardConfig {
    int train_years = 5;
    int test_years = 1;
    int start_year = 2010;
    int end_year = 2025;

    void validate() const {
        if (test_years <= 0) {
            throw std::invalid_argument("test_years must be positive, got " +
                                        std::to_string(test_years));
        }
        if (train_years < 0) {
            throw std::invalid_argument("train_years must be non-negative, got " +
                                        std::to_string(train_years));
        }
        if (start_year > end_year) {
            throw std::invalid_argument("start_year " + std::to_string(start_year) +
                                        " is after end_year " + std::to_string(end_year));
        }
    }
};

// ---------------------------------------------------------------------------
// Period — one train/test split. Dates are inclusive YYYYMMDD bounds.
// ---------------------------------------------------------------------------
struct Period {
    int index = 0;  // 1-based
    int test_year = 0;
    int train_start = 0;
    int train_end = 0;
    int test_start = 0;
    int test_end = 0;
};

enum class PeriodStatus { COMPLETED, NO_DATA, NO_SIGNALS, NO_TRADES };

inline const char* period_status_str(PeriodStatus s) {
    switch (s) {
        case PeriodStatus::COMPLETED:  return "COMPLETED";
        case PeriodStatus::NO_DATA:    return "NO_DATA";
        case PeriodStatus::NO_SIGNALS: return "NO_SIGNALS";
        case PeriodStatus::NO_TRADES:  return "NO_TRADES";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// PeriodResult — outcome of one test period
// ---------------------------------------------------------------------------
struct PeriodResult {
    Period period;
    PeriodStatus status = PeriodStatus::NO_DATA;
    std::string skip_reason;
    IndexWindow window;  // rows scanned for entries
    int signal_count = 0;
    BacktestResult result;

    bool completed() const { return status == PeriodStatus::COMPLETED; }
};

// ---------------------------------------------------------------------------
// WalkForwardAggregate — statistics over COMPLETED periods only
// ---------------------------------------------------------------------------
struct WalkForwardAggregate {
    int total_periods = 0;
    int skipped_periods = 0;
    double total_return = 0.0;
    double avg_return = 0.0;
    double std_return = 0.0;  // population std of period returns
    int win_periods = 0;
    int lose_periods = 0;
    double consistency = 0.0;  // win_periods / total_periods
    int total_trades = 0;
    double avg_win_rate = 0.0;
    double avg_max_drawdown = 0.0;
    double best_period_return = 0.0;
    double worst_period_return = 0.0;
};

// ---------------------------------------------------------------------------
// WalkForwardRunner — repeats signal generation + simulation per test period.
// The same RuleSet is used for every period.
// ---------------------------------------------------------------------------
class WalkForwardRunner {
public:
    WalkForwardRunner(const WalkForwardConfig& config, const ExecutionCosts& costs,
                      bool deduplicate = true)
        : config_(config), costs_(costs), deduplicate_(deduplicate) {
        config_.validate();
        costs_.validate();
    }

    const WalkForwardConfig& config() const { return config_; }

    std::vector<Period> generate_periods() const {
        std::vector<Period> periods;
        int first_test_year = config_.start_year + config_.train_years;
        for (int y = first_test_year; y <= config_.end_year; y += config_.test_years) {
            Period p{};
            p.index = static_cast<int>(periods.size()) + 1;
            p.test_year = y;
            p.train_start = time_utils::year_start(y - config_.train_years);
            p.train_end = time_utils::year_end(y - 1);
            p.test_start = time_utils::year_start(y);
            p.test_end = time_utils::year_end(y + config_.test_years - 1);
            periods.push_back(p);
        }
        return periods;
    }

    // Entry rows for a period: [first_row, last_row) of the rows dated inside
    // the test dates, so that every exit row stays inside the period.
    static IndexWindow test_window(const TimeSeries& series, const Period& period) {
        IndexWindow dated = series.index_range(period.test_start, period.test_end);
        if (dated.empty()) return dated;
        return IndexWindow{dated.begin, dated.end - 1};
    }

    PeriodResult run_period(const Period& period, const RuleSet& rules,
                            const TimeSeries& series) const {
        PeriodResult pr{};
        pr.period = period;
        pr.window = test_window(series, period);

        logging::logger()->debug("{}: period {} test [{} .. {}] rows [{}, {})",
                                 series.asset(), period.index,
                                 time_utils::date_to_string(period.test_start),
                                 time_utils::date_to_string(period.test_end),
                                 pr.window.begin, pr.window.end);

        if (pr.window.empty()) {
            skip(pr, PeriodStatus::NO_DATA, "No rows in test period", series);
            return pr;
        }

        SignalGenerator generator;
        auto signals = generator.generate(rules, series, pr.window, deduplicate_);
        pr.signal_count = static_cast<int>(signals.size());
        if (signals.empty()) {
            skip(pr, PeriodStatus::NO_SIGNALS, "No signals generated", series);
            return pr;
        }

        TradeSimulator simulator(costs_);
        pr.result = simulator.run(signals, series);
        if (pr.result.empty()) {
            skip(pr, PeriodStatus::NO_TRADES, "No trades executed", series);
            return pr;
        }

        pr.status = PeriodStatus::COMPLETED;
        return pr;
    }

    std::vector<PeriodResult> run_all(const RuleSet& rules, const TimeSeries& series) const {
        std::vector<PeriodResult> results;
        for (const auto& period : generate_periods()) {
            results.push_back(run_period(period, rules, series));
        }
        return results;
    }

    // Empty when no period completed.
    static std::optional<WalkForwardAggregate> aggregate(
            const std::vector<PeriodResult>& results) {
        WalkForwardAggregate agg{};
        std::vector<double> returns;
        double win_rate_sum = 0.0;
        double dd_sum = 0.0;

        for (const auto& pr : results) {
            if (!pr.completed()) {
                ++agg.skipped_periods;
                continue;
            }
            returns.push_back(pr.result.total_return);
            agg.total_trades += pr.result.total_trades;
            win_rate_sum += pr.result.win_rate;
            dd_sum += pr.result.max_drawdown;
            if (pr.result.total_return > 0.0) ++agg.win_periods;
        }
        if (returns.empty()) return std::nullopt;

        agg.total_periods = static_cast<int>(returns.size());
        double n = static_cast<double>(agg.total_periods);
        for (double r : returns) agg.total_return += r;
        agg.avg_return = agg.total_return / n;
        agg.std_return = backtest_util::stddev(returns, 0);
        agg.lose_periods = agg.total_periods - agg.win_periods;
        agg.consistency = agg.win_periods / n;
        agg.avg_win_rate = win_rate_sum / n;
        agg.avg_max_drawdown = dd_sum / n;
        agg.best_period_return = *std::max_element(returns.begin(), returns.end());
        agg.worst_period_return = *std::min_element(returns.begin(), returns.end());
        return agg;
    }

private:
    static void skip(PeriodResult& pr, PeriodStatus status, const char* reason,
                     const TimeSeries& series) {
        pr.status = status;
        pr.skip_reason = reason;
        logging::logger()->warn("{}: period {} ({}) skipped: {}", series.asset(),
                                pr.period.index, pr.period.test_year, reason);
    }

    WalkForwardConfig config_;
    ExecutionCosts costs_;
    bool deduplicate_ = true;
};
