#pragma once

#include "backtest/rule_performance.hpp"
#include "backtest/success_criteria.hpp"
#include "backtest/trade_record.hpp"
#include "backtest/trade_simulator.hpp"
#include "backtest/walk_forward.hpp"
#include "time_utils.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace backtest_io {

// Escape a string for JSON output
inline std::string json_escape(const std::string& s) {
    std::string result;
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            default:   result += c;
        }
    }
    return result;
}

// Quote a CSV field when it contains a delimiter, quote or newline.
inline std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

// Write `content` to `path`, creating parent directories.
inline void write_file(const std::string& path, const std::string& content) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " + p.parent_path().string() +
                                     ": " + ec.message());
        }
    }
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    out << content;
    if (!out) {
        throw std::runtime_error("Failed writing output file: " + path);
    }
}

// ---------------------------------------------------------------------------
// CSV
// ---------------------------------------------------------------------------
inline std::string trades_csv(const std::vector<TradeRecord>& trades) {
    std::ostringstream ss;
    ss << std::setprecision(17);
    ss << "entry_t,exit_t,entry_date,signal,rule_id,rule_text,support_count,expected_x,"
          "actual_x,profit_before_cost,transaction_cost,profit,win,cumulative_return\n";
    for (const auto& t : trades) {
        ss << t.entry_idx << "," << t.exit_idx
           << "," << csv_field(t.entry_timestamp)
           << "," << side_str(t.side)
           << "," << t.rule_id
           << "," << csv_field(t.rule_text)
           << "," << t.support_count
           << "," << t.expected_x
           << "," << t.actual_x
           << "," << t.gross_profit
           << "," << t.transaction_cost
           << "," << t.net_profit
           << "," << (t.win ? 1 : 0)
           << "," << t.cumulative_return << "\n";
    }
    return ss.str();
}

inline std::string rule_performance_csv(const std::vector<RulePerformance>& stats) {
    std::ostringstream ss;
    ss << std::setprecision(17);
    ss << "rule_id,signal,rule_text,trade_count,total_return,avg_profit,wins,win_rate\n";
    for (const auto& r : stats) {
        ss << r.rule_id << "," << side_str(r.side) << "," << csv_field(r.rule_text)
           << "," << r.trade_count << "," << r.total_return << "," << r.avg_profit
           << "," << r.wins << "," << r.win_rate << "\n";
    }
    return ss.str();
}

inline std::string periods_csv(const std::vector<PeriodResult>& periods) {
    std::ostringstream ss;
    ss << std::setprecision(17);
    ss << "period,test_year,train_start,train_end,test_start,test_end,status,total_trades,"
          "buy_trades,sell_trades,win_rate,total_return,total_return_before_cost,avg_profit,"
          "max_drawdown,buy_return,sell_return\n";
    for (const auto& pr : periods) {
        const auto& p = pr.period;
        const auto& r = pr.result;
        ss << p.index << "," << p.test_year
           << "," << time_utils::date_to_string(p.train_start)
           << "," << time_utils::date_to_string(p.train_end)
           << "," << time_utils::date_to_string(p.test_start)
           << "," << time_utils::date_to_string(p.test_end)
           << "," << period_status_str(pr.status)
           << "," << r.total_trades << "," << r.buy_trades << "," << r.sell_trades
           << "," << r.win_rate << "," << r.total_return
           << "," << r.total_return_before_cost << "," << r.avg_profit
           << "," << r.max_drawdown << "," << r.buy_total_return
           << "," << r.sell_total_return << "\n";
    }
    return ss.str();
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

// Summary fields of a BacktestResult, without the enclosing braces.
inline void write_result_fields(std::ostringstream& ss, const BacktestResult& r) {
    ss << "\"total_trades\":" << r.total_trades;
    ss << ",\"buy_trades\":" << r.buy_trades;
    ss << ",\"sell_trades\":" << r.sell_trades;
    ss << ",\"winning_trades\":" << r.winning_trades;
    ss << ",\"losing_trades\":" << r.losing_trades;
    ss << ",\"win_rate\":" << r.win_rate;
    ss << ",\"total_return\":" << r.total_return;
    ss << ",\"total_return_before_cost\":" << r.total_return_before_cost;
    ss << ",\"total_cost\":" << r.total_cost;
    ss << ",\"avg_profit\":" << r.avg_profit;
    ss << ",\"avg_win\":" << r.avg_win;
    ss << ",\"avg_loss\":" << r.avg_loss;
    ss << ",\"max_win\":" << r.max_win;
    ss << ",\"max_loss\":" << r.max_loss;
    ss << ",\"final_cumulative_return\":" << r.final_cumulative_return;
    ss << ",\"max_drawdown\":" << r.max_drawdown;
    ss << ",\"profit_factor\":" << r.profit_factor;
    ss << ",\"sharpe\":" << r.sharpe;
    ss << ",\"buy_win_rate\":" << r.buy_win_rate;
    ss << ",\"buy_total_return\":" << r.buy_total_return;
    ss << ",\"sell_win_rate\":" << r.sell_win_rate;
    ss << ",\"sell_total_return\":" << r.sell_total_return;
}

// Serialize a BacktestResult to JSON
inline std::string to_json(const BacktestResult& result, bool include_trades = true) {
    std::ostringstream ss;
    ss << std::setprecision(17);
    ss << "{";
    write_result_fields(ss, result);

    if (include_trades) {
        ss << ",\"trades\":[";
        for (size_t i = 0; i < result.trades.size(); ++i) {
            if (i > 0) ss << ",";
            const auto& t = result.trades[i];
            ss << "{";
            ss << "\"entry_t\":" << t.entry_idx;
            ss << ",\"exit_t\":" << t.exit_idx;
            ss << ",\"entry_date\":\"" << json_escape(t.entry_timestamp) << "\"";
            ss << ",\"signal\":\"" << side_str(t.side) << "\"";
            ss << ",\"rule_id\":" << t.rule_id;
            ss << ",\"actual_x\":" << t.actual_x;
            ss << ",\"profit_before_cost\":" << t.gross_profit;
            ss << ",\"profit\":" << t.net_profit;
            ss << ",\"cumulative_return\":" << t.cumulative_return;
            ss << "}";
        }
        ss << "]";
    }

    ss << "}";
    return ss.str();
}

// Serialize walk-forward periods, aggregate and rating
inline std::string to_json(const std::vector<PeriodResult>& periods,
                           const std::optional<WalkForwardAggregate>& agg,
                           const std::optional<RobustnessAssessment>& assessment) {
    std::ostringstream ss;
    ss << std::setprecision(17);
    ss << "{\"periods\":[";
    for (size_t i = 0; i < periods.size(); ++i) {
        if (i > 0) ss << ",";
        const auto& pr = periods[i];
        ss << "{";
        ss << "\"period\":" << pr.period.index;
        ss << ",\"test_year\":" << pr.period.test_year;
        ss << ",\"test_start\":\"" << time_utils::date_to_string(pr.period.test_start) << "\"";
        ss << ",\"test_end\":\"" << time_utils::date_to_string(pr.period.test_end) << "\"";
        ss << ",\"status\":\"" << period_status_str(pr.status) << "\"";
        if (pr.completed()) {
            ss << ",";
            write_result_fields(ss, pr.result);
        } else {
            ss << ",\"skip_reason\":\"" << json_escape(pr.skip_reason) << "\"";
        }
        ss << "}";
    }
    ss << "]";

    if (agg) {
        ss << ",\"aggregate\":{";
        ss << "\"total_periods\":" << agg->total_periods;
        ss << ",\"skipped_periods\":" << agg->skipped_periods;
        ss << ",\"total_return\":" << agg->total_return;
        ss << ",\"avg_return\":" << agg->avg_return;
        ss << ",\"std_return\":" << agg->std_return;
        ss << ",\"win_periods\":" << agg->win_periods;
        ss << ",\"lose_periods\":" << agg->lose_periods;
        ss << ",\"consistency\":" << agg->consistency;
        ss << ",\"total_trades\":" << agg->total_trades;
        ss << ",\"avg_win_rate\":" << agg->avg_win_rate;
        ss << ",\"avg_max_drawdown\":" << agg->avg_max_drawdown;
        ss << ",\"best_period_return\":" << agg->best_period_return;
        ss << ",\"worst_period_return\":" << agg->worst_period_return;
        ss << "}";
    } else {
        ss << ",\"aggregate\":null";
    }

    if (assessment) {
        ss << ",\"assessment\":{";
        ss << "\"consistency_rating\":\"" << assessment->consistency_rating << "\"";
        ss << ",\"return_rating\":\"" << assessment->return_rating << "\"";
        ss << ",\"stability_rating\":\"" << assessment->stability_rating << "\"";
        ss << ",\"verdict\":\"" << assessment->verdict << "\"";
        ss << "}";
    }

    ss << "}";
    return ss.str();
}

}  // namespace backtest_io
