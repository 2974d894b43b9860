#pragma once

#include "backtest/trade_record.hpp"
#include "backtest/trade_simulator.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// AllocationStrategy — how capital is split across assets
// ---------------------------------------------------------------------------
enum class AllocationStrategy { EQUAL_WEIGHT, RISK_PARITY, PERFORMANCE_BASED };

inline const char* allocation_strategy_str(AllocationStrategy s) {
    switch (s) {
        case AllocationStrategy::EQUAL_WEIGHT:      return "equal_weight";
        case AllocationStrategy::RISK_PARITY:       return "risk_parity";
        case AllocationStrategy::PERFORMANCE_BASED: return "performance_based";
    }
    return "unknown";
}

inline AllocationStrategy parse_allocation_strategy(const std::string& s) {
    if (s == "equal_weight")      return AllocationStrategy::EQUAL_WEIGHT;
    if (s == "risk_parity")       return AllocationStrategy::RISK_PARITY;
    if (s == "performance_based") return AllocationStrategy::PERFORMANCE_BASED;
    throw std::invalid_argument("Unknown allocation_strategy: '" + s + "'");
}

// ---------------------------------------------------------------------------
// AssetMetrics — single-asset summary used for weighting and reporting
// ---------------------------------------------------------------------------
struct AssetMetrics {
    std::string asset;
    int total_trades = 0;
    double total_return = 0.0;  // final cumulative return, %
    double win_rate = 0.0;      // fraction
    double max_drawdown = 0.0;  // <= 0
    double sharpe = 0.0;
    double profit_std = 0.0;    // population std of per-trade net profit
};

namespace portfolio_util {

inline AssetMetrics asset_metrics(const std::string& asset,
                                  const std::vector<TradeRecord>& trades) {
    AssetMetrics m{};
    m.asset = asset;
    m.total_trades = static_cast<int>(trades.size());
    if (trades.empty()) return m;

    auto profits = backtest_util::net_profits(trades);
    std::vector<double> cumulative;
    cumulative.reserve(profits.size());
    double cum = 0.0;
    int wins = 0;
    for (double p : profits) {
        cum += p;
        cumulative.push_back(cum);
        if (p > 0.0) ++wins;
    }
    m.total_return = cum;
    m.win_rate = static_cast<double>(wins) / m.total_trades;
    m.max_drawdown = backtest_util::max_drawdown(cumulative);
    m.sharpe = backtest_util::annualized_sharpe(profits);
    m.profit_std = backtest_util::stddev(profits, 0);
    return m;
}

inline std::vector<double> equal_weights(size_t n) {
    if (n == 0) return {};
    return std::vector<double>(n, 1.0 / static_cast<double>(n));
}

// Scale non-negative raw scores to sum to 1; equal weight when they sum to 0.
inline std::vector<double> normalize_or_equal(const std::vector<double>& raw) {
    double total = 0.0;
    for (double v : raw) total += v;
    if (!(total > 0.0)) return equal_weights(raw.size());
    std::vector<double> w;
    w.reserve(raw.size());
    for (double v : raw) w.push_back(v / total);
    return w;
}

// Weights aligned with `metrics`.
inline std::vector<double> compute_weights(AllocationStrategy strategy,
                                           const std::vector<AssetMetrics>& metrics) {
    std::vector<double> raw;
    raw.reserve(metrics.size());
    switch (strategy) {
        case AllocationStrategy::EQUAL_WEIGHT:
            return equal_weights(metrics.size());
        case AllocationStrategy::RISK_PARITY:
            for (const auto& m : metrics) {
                raw.push_back(m.profit_std > 0.0 ? 1.0 / m.profit_std : 0.0);
            }
            return normalize_or_equal(raw);
        case AllocationStrategy::PERFORMANCE_BASED:
            for (const auto& m : metrics) raw.push_back(std::max(0.0, m.sharpe));
            return normalize_or_equal(raw);
    }
    return equal_weights(metrics.size());
}

}  // namespace portfolio_util
