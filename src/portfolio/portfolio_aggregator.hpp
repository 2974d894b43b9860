#pragma once

#include "backtest/success_criteria.hpp"
#include "backtest/trade_record.hpp"
#include "backtest/trade_simulator.hpp"
#include "logging.hpp"
#include "portfolio/allocation.hpp"
#include "portfolio/correlation.hpp"
#include "time_utils.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// AssetTrades — one asset's chronologically ordered trade list
// ---------------------------------------------------------------------------
struct AssetTrades {
    std::string asset;
    std::vector<TradeRecord> trades;
};

struct ExcludedAsset {
    std::string asset;
    std::string reason;
};

struct EquityPoint {
    std::string timestamp;
    double equity = 1.0;
};

// ---------------------------------------------------------------------------
// PortfolioMetrics — computed on the blended equity curve
// ---------------------------------------------------------------------------
struct PortfolioMetrics {
    double total_return = 0.0;  // (last equity - 1) * 100
    double max_drawdown = 0.0;  // % of running peak, <= 0
    double sharpe = 0.0;
    double volatility = 0.0;    // std of equity pct-changes * 100
    int n_timestamps = 0;
};

// ---------------------------------------------------------------------------
// PortfolioResult — `defined` is false when no asset contributed trades
// ---------------------------------------------------------------------------
struct PortfolioResult {
    bool defined = false;
    AllocationStrategy strategy = AllocationStrategy::EQUAL_WEIGHT;
    std::vector<AssetMetrics> assets;
    std::vector<double> weights;  // aligned with `assets`
    std::vector<EquityPoint> equity_curve;
    PortfolioMetrics metrics;
    CorrelationMatrix correlation;
    double avg_correlation = 0.0;
    double diversification_benefit = 0.0;
    PortfolioGrade grade = PortfolioGrade::POOR;
    std::vector<ExcludedAsset> excluded;

    double weight_of(const std::string& asset) const {
        for (size_t i = 0; i < assets.size(); ++i) {
            if (assets[i].asset == asset) return weights[i];
        }
        return 0.0;
    }
};

namespace portfolio_util {

// Timeline position of a trade timestamp. Parsed instants compare by value,
// so "2021-01-04" and "2021-01-04 00:00:00" share a slot; a timestamp that
// does not parse keeps its raw text and sorts ahead of every parsed one.
using TimelineKey = std::pair<long long, std::string>;

inline TimelineKey timeline_key(const std::string& timestamp) {
    long long key = time_utils::timestamp_key(timestamp);
    if (key == time_utils::INVALID_TIMESTAMP) return {key, timestamp};
    return {key, std::string()};
}

// Equity (1 + cumulative/100) at each trade timestamp; several trades at one
// timestamp keep the last value.
inline std::map<TimelineKey, double> equity_by_timestamp(const std::vector<TradeRecord>& trades) {
    std::map<TimelineKey, double> out;
    double cum = 0.0;
    for (const auto& t : trades) {
        cum += t.net_profit;
        out[timeline_key(t.entry_timestamp)] = 1.0 + cum / 100.0;
    }
    return out;
}

inline std::map<TimelineKey, double> profit_by_timestamp(const std::vector<TradeRecord>& trades) {
    std::map<TimelineKey, double> out;
    for (const auto& t : trades) out[timeline_key(t.entry_timestamp)] += t.net_profit;
    return out;
}

// Union of every asset's trade instants in chronological order, labelled
// with the first timestamp text seen for each instant.
inline std::map<TimelineKey, std::string> union_timestamps(const std::vector<AssetTrades>& assets) {
    std::map<TimelineKey, std::string> all;
    for (const auto& a : assets) {
        for (const auto& t : a.trades) all.emplace(timeline_key(t.entry_timestamp), t.entry_timestamp);
    }
    return all;
}

// 1 + sum_i w_i * (equity_i(t) - 1), with each asset forward-filled across
// the union timeline and 1.0 before its first trade.
inline std::vector<EquityPoint> combine_equity(const std::vector<AssetTrades>& assets,
                                               const std::vector<double>& weights) {
    auto timeline = union_timestamps(assets);
    std::vector<EquityPoint> curve;
    curve.reserve(timeline.size());
    for (const auto& kv : timeline) curve.push_back(EquityPoint{kv.second, 1.0});

    for (size_t i = 0; i < assets.size(); ++i) {
        auto equity = equity_by_timestamp(assets[i].trades);
        double last = 1.0;
        size_t k = 0;
        for (const auto& kv : timeline) {
            auto it = equity.find(kv.first);
            if (it != equity.end()) last = it->second;
            curve[k++].equity += weights[i] * (last - 1.0);
        }
    }
    return curve;
}

inline PortfolioMetrics compute_metrics(const std::vector<EquityPoint>& curve) {
    PortfolioMetrics m{};
    m.n_timestamps = static_cast<int>(curve.size());
    if (curve.empty()) return m;

    m.total_return = (curve.back().equity - 1.0) * 100.0;

    double peak = curve.front().equity;
    for (const auto& p : curve) {
        peak = std::max(peak, p.equity);
        if (peak > 0.0) {
            m.max_drawdown = std::min(m.max_drawdown, (p.equity - peak) / peak * 100.0);
        }
    }

    std::vector<double> changes;
    for (size_t k = 1; k < curve.size(); ++k) {
        double prev = curve[k - 1].equity;
        if (prev == 0.0) continue;
        changes.push_back((curve[k].equity - prev) / prev);
    }
    m.sharpe = backtest_util::annualized_sharpe(changes);
    m.volatility = backtest_util::stddev(changes, 1) * 100.0;
    return m;
}

// Per-asset profit series on the union timeline, 0 where the asset did not trade.
inline std::vector<std::vector<double>> aligned_profits(const std::vector<AssetTrades>& assets) {
    auto timeline = union_timestamps(assets);
    std::vector<std::vector<double>> out;
    out.reserve(assets.size());
    for (const auto& a : assets) {
        auto profits = profit_by_timestamp(a.trades);
        std::vector<double> row(timeline.size(), 0.0);
        size_t k = 0;
        for (const auto& kv : timeline) {
            auto it = profits.find(kv.first);
            if (it != profits.end()) row[k] = it->second;
            ++k;
        }
        out.push_back(std::move(row));
    }
    return out;
}

}  // namespace portfolio_util

// ---------------------------------------------------------------------------
// PortfolioAggregator — blends independent per-asset runs
// ---------------------------------------------------------------------------
class PortfolioAggregator {
public:
    explicit PortfolioAggregator(AllocationStrategy strategy,
                                 const PortfolioGradeCriteria& grading = PortfolioGradeCriteria{})
        : strategy_(strategy), grading_(grading) {}

    AllocationStrategy strategy() const { return strategy_; }

    // `excluded` lists assets already dropped upstream; assets without trades
    // are added to it here.
    PortfolioResult aggregate(const std::vector<AssetTrades>& inputs,
                              std::vector<ExcludedAsset> excluded = {}) const {
        PortfolioResult result{};
        result.strategy = strategy_;

        std::vector<AssetTrades> active;
        for (const auto& in : inputs) {
            if (in.trades.empty()) {
                excluded.push_back({in.asset, "No trades"});
                logging::logger()->warn("{}: excluded from portfolio (no trades)", in.asset);
                continue;
            }
            active.push_back(in);
        }
        result.excluded = std::move(excluded);

        if (active.empty()) {
            logging::logger()->warn("Portfolio undefined: no asset contributed trades");
            return result;
        }

        std::vector<std::string> names;
        for (const auto& a : active) {
            result.assets.push_back(portfolio_util::asset_metrics(a.asset, a.trades));
            names.push_back(a.asset);
        }
        result.weights = portfolio_util::compute_weights(strategy_, result.assets);
        result.equity_curve = portfolio_util::combine_equity(active, result.weights);
        result.metrics = portfolio_util::compute_metrics(result.equity_curve);
        result.correlation = portfolio_util::correlation_matrix(
            names, portfolio_util::aligned_profits(active));
        result.avg_correlation = result.correlation.average_pairwise();

        double mean_single = 0.0;
        for (const auto& m : result.assets) mean_single += m.total_return;
        mean_single /= static_cast<double>(result.assets.size());
        result.diversification_benefit = result.metrics.total_return - mean_single;

        result.grade = grading_.evaluate(result.metrics.total_return, result.metrics.sharpe,
                                         result.metrics.max_drawdown);
        result.defined = true;

        logging::logger()->info("Portfolio ({}): {} assets, {} timestamps, return {:+.3f}%",
                                allocation_strategy_str(strategy_), result.assets.size(),
                                result.metrics.n_timestamps, result.metrics.total_return);
        return result;
    }

private:
    AllocationStrategy strategy_;
    PortfolioGradeCriteria grading_;
};
