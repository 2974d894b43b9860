#pragma once

#include "backtest/execution_costs.hpp"
#include "backtest/signal.hpp"
#include "backtest/trade_record.hpp"
#include "data/time_series.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// BacktestResult — trade list plus summary statistics (percentage units)
// ---------------------------------------------------------------------------
struct BacktestResult {
    std::vector<TradeRecord> trades;
    int total_trades = 0;
    int buy_trades = 0;
    int sell_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;                  // fraction in [0, 1]
    double total_return = 0.0;              // sum of net profit
    double total_return_before_cost = 0.0;  // sum of gross profit
    double total_cost = 0.0;
    double avg_profit = 0.0;
    double avg_profit_before_cost = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double max_win = 0.0;
    double max_loss = 0.0;
    double final_cumulative_return = 0.0;
    double max_drawdown = 0.0;              // <= 0
    double profit_factor = 0.0;
    double sharpe = 0.0;

    double buy_win_rate = 0.0;
    double buy_avg_profit = 0.0;
    double buy_total_return = 0.0;
    double sell_win_rate = 0.0;
    double sell_avg_profit = 0.0;
    double sell_total_return = 0.0;

    bool empty() const { return trades.empty(); }
};

// ---------------------------------------------------------------------------
// BacktestResult utilities — shared by TradeSimulator, WalkForwardRunner and
// the portfolio aggregator
// ---------------------------------------------------------------------------
namespace backtest_util {

constexpr double TRADING_DAYS_PER_YEAR = 252.0;

// cumulative[i] - max(cumulative[0..i]); every entry <= 0.
inline std::vector<double> drawdown_series(const std::vector<double>& cumulative) {
    std::vector<double> dd;
    dd.reserve(cumulative.size());
    double peak = 0.0;
    for (size_t i = 0; i < cumulative.size(); ++i) {
        if (i == 0 || cumulative[i] > peak) peak = cumulative[i];
        dd.push_back(cumulative[i] - peak);
    }
    return dd;
}

inline double max_drawdown(const std::vector<double>& cumulative) {
    auto dd = drawdown_series(cumulative);
    if (dd.empty()) return 0.0;
    return *std::min_element(dd.begin(), dd.end());
}

inline double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

// Sample (ddof = 1) or population (ddof = 0) standard deviation.
inline double stddev(const std::vector<double>& values, int ddof = 1) {
    if (static_cast<int>(values.size()) <= ddof) return 0.0;
    double m = mean(values);
    double sum_sq = 0.0;
    for (double v : values) sum_sq += (v - m) * (v - m);
    return std::sqrt(sum_sq / static_cast<double>(static_cast<int>(values.size()) - ddof));
}

// mean / sample std * sqrt(252); 0 for fewer than two values or zero variance.
inline double annualized_sharpe(const std::vector<double>& returns) {
    if (returns.size() < 2) return 0.0;
    double sd = stddev(returns, 1);
    if (!(sd > 0.0)) return 0.0;
    return mean(returns) / sd * std::sqrt(TRADING_DAYS_PER_YEAR);
}

inline std::vector<double> net_profits(const std::vector<TradeRecord>& trades) {
    std::vector<double> out;
    out.reserve(trades.size());
    for (const auto& t : trades) out.push_back(t.net_profit);
    return out;
}

inline std::vector<double> cumulative_returns(const std::vector<TradeRecord>& trades) {
    std::vector<double> out;
    out.reserve(trades.size());
    for (const auto& t : trades) out.push_back(t.cumulative_return);
    return out;
}

// Rebuild cumulative_return as the running sum of net_profit, in list order.
inline void accumulate_returns(std::vector<TradeRecord>& trades) {
    double cum = 0.0;
    for (auto& t : trades) {
        cum += t.net_profit;
        t.cumulative_return = cum;
    }
}

// Recompute every summary field from result.trades.
inline void recompute_derived(BacktestResult& r) {
    auto trades = std::move(r.trades);
    r = BacktestResult{};
    r.trades = std::move(trades);
    if (r.trades.empty()) return;

    double gross_wins = 0.0;
    double gross_losses = 0.0;
    double win_sum = 0.0;
    double loss_sum = 0.0;
    int buy_wins = 0;
    int sell_wins = 0;
    r.max_win = r.trades.front().net_profit;
    r.max_loss = r.trades.front().net_profit;

    for (const auto& t : r.trades) {
        ++r.total_trades;
        r.total_return += t.net_profit;
        r.total_return_before_cost += t.gross_profit;
        r.total_cost += t.transaction_cost;
        r.max_win = std::max(r.max_win, t.net_profit);
        r.max_loss = std::min(r.max_loss, t.net_profit);

        if (t.win) {
            ++r.winning_trades;
            win_sum += t.net_profit;
        } else {
            ++r.losing_trades;
            loss_sum += t.net_profit;
        }
        if (t.net_profit > 0.0) gross_wins += t.net_profit;
        else gross_losses += -t.net_profit;

        if (t.side == Side::BUY) {
            ++r.buy_trades;
            r.buy_total_return += t.net_profit;
            if (t.win) ++buy_wins;
        } else {
            ++r.sell_trades;
            r.sell_total_return += t.net_profit;
            if (t.win) ++sell_wins;
        }
    }

    double n = static_cast<double>(r.total_trades);
    r.win_rate = r.winning_trades / n;
    r.avg_profit = r.total_return / n;
    r.avg_profit_before_cost = r.total_return_before_cost / n;
    if (r.winning_trades > 0) r.avg_win = win_sum / r.winning_trades;
    if (r.losing_trades > 0) r.avg_loss = loss_sum / r.losing_trades;
    if (gross_losses > 0.0) r.profit_factor = gross_wins / gross_losses;

    if (r.buy_trades > 0) {
        r.buy_win_rate = static_cast<double>(buy_wins) / r.buy_trades;
        r.buy_avg_profit = r.buy_total_return / r.buy_trades;
    }
    if (r.sell_trades > 0) {
        r.sell_win_rate = static_cast<double>(sell_wins) / r.sell_trades;
        r.sell_avg_profit = r.sell_total_return / r.sell_trades;
    }

    r.final_cumulative_return = r.trades.back().cumulative_return;
    r.max_drawdown = max_drawdown(cumulative_returns(r.trades));
    r.sharpe = annualized_sharpe(net_profits(r.trades));
}

}  // namespace backtest_util

// ---------------------------------------------------------------------------
// TradeSimulator — turns signals into one-period trades
// ---------------------------------------------------------------------------
class TradeSimulator {
public:
    explicit TradeSimulator(const ExecutionCosts& costs) : costs_(costs) {
        costs_.validate();
    }

    const ExecutionCosts& costs() const { return costs_; }

    // Signals are processed in order of entry row; a signal whose exit row
    // falls outside the series is dropped.
    std::vector<TradeRecord> simulate(const std::vector<Signal>& signals,
                                      const TimeSeries& series) const {
        std::vector<Signal> ordered(signals);
        std::stable_sort(ordered.begin(), ordered.end(),
                         [](const Signal& a, const Signal& b) { return a.t < b.t; });

        const double cost = costs_.round_trip_cost_pct();
        std::vector<TradeRecord> trades;
        trades.reserve(ordered.size());
        int dropped = 0;

        for (const auto& sig : ordered) {
            int exit_idx = sig.t + 1;
            if (sig.t < 0 || exit_idx >= series.size()) {
                ++dropped;
                continue;
            }
            TradeRecord tr{};
            tr.entry_idx = sig.t;
            tr.exit_idx = exit_idx;
            tr.entry_timestamp = series.timestamp(sig.t);
            tr.entry_date = series.date(sig.t);
            tr.side = sig.side;
            tr.rule_id = sig.rule_id;
            tr.rule_text = sig.rule_text;
            tr.support_count = sig.support_count;
            tr.expected_x = sig.expected_x;
            tr.actual_x = series.x(exit_idx);
            tr.gross_profit = sig.side == Side::BUY ? tr.actual_x : -tr.actual_x;
            tr.transaction_cost = cost;
            tr.net_profit = tr.gross_profit - cost;
            tr.win = tr.net_profit > 0.0;
            trades.push_back(std::move(tr));
        }
        backtest_util::accumulate_returns(trades);

        if (dropped > 0) {
            logging::logger()->warn("{}: dropped {} signals without a next-row outcome",
                                    series.asset(), dropped);
        }
        logging::logger()->info("{}: executed {} trades (cost {:.4f}% per trade)",
                                series.asset(), trades.size(), cost);
        return trades;
    }

    BacktestResult run(const std::vector<Signal>& signals, const TimeSeries& series) const {
        BacktestResult result{};
        result.trades = simulate(signals, series);
        backtest_util::recompute_derived(result);
        return result;
    }

private:
    ExecutionCosts costs_;
};
