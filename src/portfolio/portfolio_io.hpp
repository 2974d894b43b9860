#pragma once

#include "backtest/backtest_result_io.hpp"
#include "portfolio/portfolio_aggregator.hpp"

#include <iomanip>
#include <sstream>
#include <string>

namespace portfolio_io {

inline std::string equity_curve_csv(const std::vector<EquityPoint>& curve) {
    std::ostringstream ss;
    ss << std::setprecision(17);
    ss << "timestamp,equity\n";
    for (const auto& p : curve) {
        ss << backtest_io::csv_field(p.timestamp) << "," << p.equity << "\n";
    }
    return ss.str();
}

inline std::string asset_metrics_csv(const PortfolioResult& result) {
    std::ostringstream ss;
    ss << std::setprecision(17);
    ss << "asset,weight,total_return,win_rate,total_trades,max_drawdown,sharpe\n";
    for (size_t i = 0; i < result.assets.size(); ++i) {
        const auto& m = result.assets[i];
        ss << m.asset << "," << result.weights[i] << "," << m.total_return << ","
           << m.win_rate << "," << m.total_trades << "," << m.max_drawdown << ","
           << m.sharpe << "\n";
    }
    return ss.str();
}

inline std::string correlation_csv(const CorrelationMatrix& cm) {
    std::ostringstream ss;
    ss << std::setprecision(17);
    ss << "asset";
    for (const auto& a : cm.assets) ss << "," << a;
    ss << "\n";
    for (size_t i = 0; i < cm.size(); ++i) {
        ss << cm.assets[i];
        for (size_t j = 0; j < cm.size(); ++j) ss << "," << cm.at(i, j);
        ss << "\n";
    }
    return ss.str();
}

inline std::string to_json(const PortfolioResult& r) {
    std::ostringstream ss;
    ss << std::setprecision(17);
    ss << "{";
    ss << "\"defined\":" << (r.defined ? "true" : "false");
    ss << ",\"allocation_strategy\":\"" << allocation_strategy_str(r.strategy) << "\"";

    ss << ",\"assets\":[";
    for (size_t i = 0; i < r.assets.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& m = r.assets[i];
        ss << "{";
        ss << "\"asset\":\"" << backtest_io::json_escape(m.asset) << "\"";
        ss << ",\"weight\":" << r.weights[i];
        ss << ",\"total_return\":" << m.total_return;
        ss << ",\"win_rate\":" << m.win_rate;
        ss << ",\"total_trades\":" << m.total_trades;
        ss << ",\"max_drawdown\":" << m.max_drawdown;
        ss << ",\"sharpe\":" << m.sharpe;
        ss << "}";
    }
    ss << "]";

    ss << ",\"excluded\":[";
    for (size_t i = 0; i < r.excluded.size(); ++i) {
        if (i > 0) ss << ",";
        ss << "{\"asset\":\"" << backtest_io::json_escape(r.excluded[i].asset) << "\""
           << ",\"reason\":\"" << backtest_io::json_escape(r.excluded[i].reason) << "\"}";
    }
    ss << "]";

    if (r.defined) {
        ss << ",\"portfolio\":{";
        ss << "\"total_return\":" << r.metrics.total_return;
        ss << ",\"max_drawdown\":" << r.metrics.max_drawdown;
        ss << ",\"sharpe\":" << r.metrics.sharpe;
        ss << ",\"volatility\":" << r.metrics.volatility;
        ss << ",\"n_timestamps\":" << r.metrics.n_timestamps;
        ss << ",\"avg_correlation\":" << r.avg_correlation;
        ss << ",\"diversification_benefit\":" << r.diversification_benefit;
        ss << ",\"grade\":\"" << portfolio_grade_str(r.grade) << "\"";
        ss << "}";
    }

    ss << "}";
    return ss.str();
}

}  // namespace portfolio_io
