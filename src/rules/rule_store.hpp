#pragma once

#include "data/delimited_reader.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "rules/condition_parser.hpp"
#include "rules/rule.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// RuleSortKey — ranking used before top-N truncation
// ---------------------------------------------------------------------------
enum class RuleSortKey { SUPPORT, EXTREME_SCORE, SNR, EXTREMENESS, DISCOVERY };

inline const char* sort_key_str(RuleSortKey k) {
    switch (k) {
        case RuleSortKey::SUPPORT:       return "support";
        case RuleSortKey::EXTREME_SCORE: return "extreme_score";
        case RuleSortKey::SNR:           return "snr";
        case RuleSortKey::EXTREMENESS:   return "extremeness";
        case RuleSortKey::DISCOVERY:     return "discovery";
    }
    return "unknown";
}

inline RuleSortKey parse_sort_key(const std::string& s) {
    if (s == "support")       return RuleSortKey::SUPPORT;
    if (s == "extreme_score") return RuleSortKey::EXTREME_SCORE;
    if (s == "snr")           return RuleSortKey::SNR;
    if (s == "extremeness")   return RuleSortKey::EXTREMENESS;
    if (s == "discovery")     return RuleSortKey::DISCOVERY;
    throw std::invalid_argument("Unknown sort_by: '" + s + "'");
}

// ---------------------------------------------------------------------------
// RuleStore — loads mined rule tables from
//   <root>/<asset>/<positive|negative>/pool/zrp01a.txt
// ---------------------------------------------------------------------------
class RuleStore {
public:
    static constexpr int MAX_ATTR_COLUMNS = 8;

    explicit RuleStore(std::string root) : root_(std::move(root)) {}

    std::string rule_path(const std::string& asset, Direction direction) const {
        return (std::filesystem::path(root_) / asset / direction_str(direction) /
                "pool" / "zrp01a.txt").string();
    }

    // Load one direction's rules, ranked by `sort_by` and truncated to `top_n`
    // (top_n == 0 keeps every rule).
    std::vector<Rule> load(const std::string& asset, Direction direction,
                           int top_n = 10, RuleSortKey sort_by = RuleSortKey::SUPPORT) const {
        return load_file(rule_path(asset, direction), direction, top_n, sort_by);
    }

    RuleSet load_all(const std::string& asset, int top_n = 10,
                     RuleSortKey sort_by = RuleSortKey::SUPPORT) const {
        auto positive = load(asset, Direction::POSITIVE, top_n, sort_by);
        auto negative = load(asset, Direction::NEGATIVE, top_n, sort_by);
        logging::logger()->info("{}: {} rules loaded ({} BUY + {} SELL, sort_by={})",
                                asset, positive.size() + negative.size(),
                                positive.size(), negative.size(), sort_key_str(sort_by));
        return RuleSet(std::move(positive), std::move(negative));
    }

    static std::vector<Rule> load_file(const std::string& path, Direction direction,
                                       int top_n, RuleSortKey sort_by) {
        if (!std::filesystem::exists(path)) {
            throw MissingInputError(path);
        }
        std::vector<int> ragged;
        auto table = delimited::read_table(path, '\t', &ragged);
        if (!table) {
            throw MissingInputError(path);
        }
        if (!ragged.empty()) {
            throw std::runtime_error("Ragged row at line " + std::to_string(ragged.front()) +
                                     " in " + path);
        }
        for (const char* required : {"X_mean", "X_sigma", "support_count", "support_rate"}) {
            if (!table->has_column(required)) {
                throw std::runtime_error(std::string("Rule table missing column '") +
                                         required + "': " + path);
            }
        }

        auto rows = rank_rows(*table, sort_by, path);
        if (top_n > 0 && static_cast<int>(rows.size()) > top_n) {
            rows.resize(static_cast<size_t>(top_n));
        }

        std::vector<Rule> rules;
        rules.reserve(rows.size());
        int dropped_rules = 0;
        for (int row_idx : rows) {
            auto rule = parse_row(*table, row_idx, direction, path);
            if (rule) {
                rules.push_back(std::move(*rule));
            } else {
                ++dropped_rules;
            }
        }
        if (dropped_rules > 0) {
            logging::logger()->warn("{}: {} rule(s) discarded with no valid condition",
                                    path, dropped_rules);
        }
        return rules;
    }

private:
    std::string root_;

    // Optional score columns may be absent or blank; both read as 0.
    static double numeric_cell(const delimited::Table& table, int row, const char* column,
                               const std::string& path, bool required = true) {
        int col = table.column(column);
        if (col < 0) return 0.0;
        const auto& cell = table.rows[static_cast<size_t>(row)][static_cast<size_t>(col)];
        if (!required && cell.empty()) return 0.0;
        auto v = delimited::parse_double(cell);
        if (!v) {
            throw std::runtime_error("Non-numeric " + std::string(column) + " '" + cell +
                                     "' at data row " + std::to_string(row) + " in " + path);
        }
        return *v;
    }

    // Data-row indices in ranked order. Sorting is stable so equal keys keep
    // file order.
    static std::vector<int> rank_rows(const delimited::Table& table, RuleSortKey sort_by,
                                      const std::string& path) {
        std::vector<int> rows(table.rows.size());
        for (size_t i = 0; i < rows.size(); ++i) rows[i] = static_cast<int>(i);

        const char* column = nullptr;
        switch (sort_by) {
            case RuleSortKey::SUPPORT:       column = "support_count"; break;
            case RuleSortKey::EXTREME_SCORE: column = "ExtremeScore"; break;
            case RuleSortKey::SNR:           column = "SNR"; break;
            case RuleSortKey::EXTREMENESS:   column = "Extremeness"; break;
            case RuleSortKey::DISCOVERY:     return rows;
        }
        if (!table.has_column(column)) {
            logging::logger()->warn("{}: no '{}' column, keeping discovery order", path, column);
            return rows;
        }

        std::vector<double> keys(rows.size());
        for (size_t i = 0; i < rows.size(); ++i) {
            keys[i] = numeric_cell(table, static_cast<int>(i), column, path,
                                   sort_by == RuleSortKey::SUPPORT);
        }
        // Descending, NaN keys last.
        std::stable_sort(rows.begin(), rows.end(), [&](int a, int b) {
            bool a_nan = std::isnan(keys[a]);
            bool b_nan = std::isnan(keys[b]);
            if (a_nan || b_nan) return !a_nan && b_nan;
            return keys[a] > keys[b];
        });
        return rows;
    }

    static std::optional<Rule> parse_row(const delimited::Table& table, int row,
                                         Direction direction, const std::string& path) {
        Rule rule{};
        rule.id = row;
        rule.direction = direction;

        for (int i = 1; i <= MAX_ATTR_COLUMNS; ++i) {
            int col = table.column("Attr" + std::to_string(i));
            if (col < 0) break;
            const auto& cell = table.rows[static_cast<size_t>(row)][static_cast<size_t>(col)];
            if (is_absent_cell(cell)) break;

            auto parsed = parse_condition(cell);
            if (parsed.ok()) {
                rule.conditions.push_back(*parsed.condition);
            } else {
                logging::logger()->warn("{}: rule {} drops condition '{}' ({})", path, row,
                                        parsed.error.token, parsed.error.describe());
            }
        }
        if (rule.conditions.empty()) return std::nullopt;

        rule.x_mean = numeric_cell(table, row, "X_mean", path);
        rule.x_sigma = numeric_cell(table, row, "X_sigma", path);
        double support = numeric_cell(table, row, "support_count", path);
        if (!std::isfinite(support) || support < 0.0 ||
            support > static_cast<double>(std::numeric_limits<int>::max())) {
            throw std::runtime_error("Invalid support_count at data row " + std::to_string(row) +
                                     " in " + path);
        }
        rule.support_count = static_cast<int>(support);
        rule.support_rate = numeric_cell(table, row, "support_rate", path);
        rule.extreme_score = numeric_cell(table, row, "ExtremeScore", path, false);
        rule.snr = numeric_cell(table, row, "SNR", path, false);
        rule.extremeness = numeric_cell(table, row, "Extremeness", path, false);
        rule.signal_strength = numeric_cell(table, row, "SignalStrength", path, false);
        return rule;
    }
};
