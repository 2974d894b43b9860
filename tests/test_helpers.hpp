#pragma once

// test_helpers.hpp — synthetic series, rules and temp files shared by the suites

#include "backtest/trade_record.hpp"
#include "data/time_series.hpp"
#include "rules/rule.hpp"
#include "time_utils.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace test_helpers {

// Consecutive valid calendar dates starting at Jan 1 of `year`
// (28-day months keep the arithmetic trivial).
inline std::string day_timestamp(int year, int i) {
    int y = year + i / (28 * 12);
    int m = 1 + (i / 28) % 12;
    int d = 1 + i % 28;
    return time_utils::date_to_string(time_utils::make_date(y, m, d));
}

// Series with named attribute columns and X values; timestamps from day_timestamp().
inline TimeSeries make_series(const std::vector<std::pair<std::string, std::vector<int>>>& attrs,
                              const std::vector<double>& x, int year = 2021,
                              const std::string& asset = "TEST") {
    TimeSeries series(asset);
    for (const auto& a : attrs) series.add_attribute(a.first);
    for (size_t i = 0; i < x.size(); ++i) {
        std::vector<uint8_t> values;
        for (const auto& a : attrs) values.push_back(static_cast<uint8_t>(a.second[i]));
        series.append(day_timestamp(year, static_cast<int>(i)), values, x[i]);
    }
    return series;
}

// Series with explicit timestamps and a single always-active attribute "ON".
inline TimeSeries make_dated_series(const std::vector<std::string>& timestamps,
                                    const std::vector<double>& x,
                                    const std::string& asset = "TEST") {
    TimeSeries series(asset);
    series.add_attribute("ON");
    for (size_t i = 0; i < timestamps.size(); ++i) {
        series.append(timestamps[i], {1}, x[i]);
    }
    return series;
}

inline Rule make_rule(int id, Direction direction,
                      const std::vector<std::pair<std::string, int>>& conditions,
                      int support_count = 10, double x_mean = 0.0) {
    Rule r{};
    r.id = id;
    r.direction = direction;
    for (const auto& c : conditions) r.conditions.push_back(Condition{c.first, c.second});
    r.support_count = support_count;
    r.x_mean = x_mean;
    return r;
}

inline TradeRecord make_trade(const std::string& timestamp, double net_profit,
                              Side side = Side::BUY, int rule_id = 0) {
    TradeRecord t{};
    t.entry_timestamp = timestamp;
    t.entry_date = time_utils::parse_date(timestamp);
    t.side = side;
    t.rule_id = rule_id;
    t.gross_profit = net_profit;
    t.net_profit = net_profit;
    t.win = net_profit > 0.0;
    return t;
}

// Trades with running cumulative_return filled in.
inline std::vector<TradeRecord> make_trades(
        const std::vector<std::pair<std::string, double>>& items) {
    std::vector<TradeRecord> trades;
    double cum = 0.0;
    for (const auto& it : items) {
        auto t = make_trade(it.first, it.second);
        cum += it.second;
        t.cumulative_return = cum;
        trades.push_back(t);
    }
    return trades;
}

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        static const unsigned seed = std::random_device{}();
        path_ = std::filesystem::temp_directory_path() /
                ("rulebt_test_" + std::to_string(seed) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

inline void write_text(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

inline std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Tab-separated rule table with Attr1..Attr3 and the required statistics.
// Each row: {attr1, attr2, attr3, x_mean, support_count}.
struct RuleRow {
    std::string attr1;
    std::string attr2 = "0";
    std::string attr3 = "0";
    double x_mean = 0.1;
    int support_count = 10;
};

inline std::string rule_table(const std::vector<RuleRow>& rows) {
    std::ostringstream ss;
    ss << "Attr1\tAttr2\tAttr3\tX_mean\tX_sigma\tsupport_count\tsupport_rate\n";
    for (const auto& r : rows) {
        ss << r.attr1 << "\t" << r.attr2 << "\t" << r.attr3 << "\t" << r.x_mean
           << "\t0.5\t" << r.support_count << "\t0.01\n";
    }
    return ss.str();
}

}  // namespace test_helpers
