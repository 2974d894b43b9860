#pragma once

#include "backtest/signal.hpp"
#include "data/time_series.hpp"
#include "logging.hpp"
#include "rules/rule.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// SignalGenerator — scans a row window and emits one Signal per matching rule.
// With deduplication on, at most one signal survives per row: highest
// support_count, then lowest rule_id, then BUY before SELL.
// ---------------------------------------------------------------------------
class SignalGenerator {
public:
    // Every condition must hold: attribute active at t - lag, t - lag >= 0.
    static bool matches(const Rule& rule, const TimeSeries& series, int t) {
        if (rule.conditions.empty()) return false;
        for (const auto& c : rule.conditions) {
            int idx = t - c.lag;
            if (idx < 0) return false;
            if (!series.is_active(c.attribute, idx)) return false;
        }
        return true;
    }

    // True when `a` should be kept over `b` for the same row.
    static bool preferred(const Signal& a, const Signal& b) {
        if (a.support_count != b.support_count) return a.support_count > b.support_count;
        if (a.rule_id != b.rule_id) return a.rule_id < b.rule_id;
        return a.side == Side::BUY && b.side == Side::SELL;
    }

    // Rows actually scanned for `window`: [max(begin, max_lag), min(end, size - 1)).
    static IndexWindow scan_range(const RuleSet& rules, const TimeSeries& series,
                                  IndexWindow window) {
        int max_lag = rules.max_lag();
        IndexWindow scan{};
        if (series.size() < max_lag + 2) return scan;
        scan.begin = std::max({window.begin, max_lag, 0});
        scan.end = std::min(window.end, series.size() - 1);
        if (scan.end < scan.begin) scan.end = scan.begin;
        return scan;
    }

    std::vector<Signal> generate(const RuleSet& rules, const TimeSeries& series,
                                 IndexWindow window, bool deduplicate = true) const {
        std::vector<Signal> signals;
        IndexWindow scan = scan_range(rules, series, window);
        if (scan.empty()) {
            logging::logger()->debug("{}: scan window [{}, {}) is empty (max_lag={}, rows={})",
                                     series.asset(), window.begin, window.end,
                                     rules.max_lag(), series.size());
            return signals;
        }

        int candidates = 0;
        std::vector<Signal> at_t;
        for (int t = scan.begin; t < scan.end; ++t) {
            at_t.clear();
            collect(rules.positive(), series, t, at_t);
            collect(rules.negative(), series, t, at_t);
            candidates += static_cast<int>(at_t.size());
            if (at_t.empty()) continue;

            if (deduplicate) {
                auto best = std::min_element(at_t.begin(), at_t.end(), preferred);
                signals.push_back(*best);
            } else {
                signals.insert(signals.end(), at_t.begin(), at_t.end());
            }
        }

        int buys = static_cast<int>(std::count_if(signals.begin(), signals.end(),
            [](const Signal& s) { return s.side == Side::BUY; }));
        logging::logger()->info("{}: {} signals over rows [{}, {}) ({} BUY, {} SELL{})",
                                series.asset(), signals.size(), scan.begin, scan.end,
                                buys, static_cast<int>(signals.size()) - buys,
                                deduplicate ? ", " + std::to_string(candidates) +
                                                  " candidates before dedup"
                                            : std::string());
        return signals;
    }

    std::vector<Signal> generate(const RuleSet& rules, const TimeSeries& series,
                                 bool deduplicate = true) const {
        return generate(rules, series, IndexWindow{0, series.size()}, deduplicate);
    }

private:
    static void collect(const std::vector<Rule>& rules, const TimeSeries& series, int t,
                        std::vector<Signal>& out) {
        for (const auto& rule : rules) {
            if (!matches(rule, series, t)) continue;
            Signal s{};
            s.t = t;
            s.timestamp = series.timestamp(t);
            s.side = rule.side();
            s.direction = rule.direction;
            s.rule_id = rule.id;
            s.rule_text = rule.rule_text();
            s.support_count = rule.support_count;
            s.expected_x = rule.x_mean;
            out.push_back(std::move(s));
        }
    }
};
