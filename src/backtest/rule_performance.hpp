#pragma once

#include "backtest/trade_record.hpp"
#include "rules/rule.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// RulePerformance — per (rule_id, side) breakdown of a trade list
// ---------------------------------------------------------------------------
struct RulePerformance {
    int rule_id = 0;
    Side side = Side::BUY;
    std::string rule_text;
    int trade_count = 0;
    int wins = 0;
    double total_return = 0.0;
    double avg_profit = 0.0;
    double win_rate = 0.0;  // fraction
};

namespace backtest_util {

// Sorted by total_return descending; ties keep (rule_id, side) order.
inline std::vector<RulePerformance> rule_performance(const std::vector<TradeRecord>& trades) {
    std::map<std::pair<int, int>, RulePerformance> by_rule;
    for (const auto& t : trades) {
        auto key = std::make_pair(t.rule_id, t.side == Side::BUY ? 0 : 1);
        auto& rp = by_rule[key];
        if (rp.trade_count == 0) {
            rp.rule_id = t.rule_id;
            rp.side = t.side;
            rp.rule_text = t.rule_text;
        }
        ++rp.trade_count;
        rp.total_return += t.net_profit;
        if (t.win) ++rp.wins;
    }

    std::vector<RulePerformance> out;
    out.reserve(by_rule.size());
    for (auto& kv : by_rule) {
        auto& rp = kv.second;
        rp.avg_profit = rp.total_return / rp.trade_count;
        rp.win_rate = static_cast<double>(rp.wins) / rp.trade_count;
        out.push_back(std::move(rp));
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const RulePerformance& a, const RulePerformance& b) {
                         return a.total_return > b.total_return;
                     });
    return out;
}

}  // namespace backtest_util
