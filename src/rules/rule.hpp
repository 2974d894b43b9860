#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Direction — which mined rule pool a rule came from
// ---------------------------------------------------------------------------
enum class Direction { POSITIVE, NEGATIVE };

// BUY for positive-direction rules, SELL for negative-direction rules.
enum class Side { BUY, SELL };

inline Side side_for(Direction d) {
    return d == Direction::POSITIVE ? Side::BUY : Side::SELL;
}

inline const char* direction_str(Direction d) {
    return d == Direction::POSITIVE ? "positive" : "negative";
}

inline const char* side_str(Side s) {
    return s == Side::BUY ? "BUY" : "SELL";
}

// ---------------------------------------------------------------------------
// Condition — attribute must be active (== 1) at index t - lag
// ---------------------------------------------------------------------------
struct Condition {
    std::string attribute;
    int lag = 0;

    std::string to_string() const {
        return attribute + "(t-" + std::to_string(lag) + ")";
    }
};

// ---------------------------------------------------------------------------
// Rule — conjunction of lagged conditions plus mining statistics.
// Statistics are taken as-is from the rule table and only used for ranking.
// ---------------------------------------------------------------------------
struct Rule {
    int id = 0;
    Direction direction = Direction::POSITIVE;
    std::vector<Condition> conditions;

    double x_mean = 0.0;
    double x_sigma = 0.0;
    int support_count = 0;
    double support_rate = 0.0;

    // Optional quality scores from the miner (0 when the table lacks them).
    double extreme_score = 0.0;
    double snr = 0.0;
    double extremeness = 0.0;
    double signal_strength = 0.0;

    Side side() const { return side_for(direction); }

    int max_lag() const {
        int m = 0;
        for (const auto& c : conditions) m = std::max(m, c.lag);
        return m;
    }

    std::string rule_text() const {
        std::string text;
        for (size_t i = 0; i < conditions.size(); ++i) {
            if (i > 0) text += " AND ";
            text += conditions[i].to_string();
        }
        return text;
    }
};

// ---------------------------------------------------------------------------
// RuleSummary — per-direction counts and averages
// ---------------------------------------------------------------------------
struct RuleSummary {
    int positive_count = 0;
    int negative_count = 0;
    double positive_avg_support = 0.0;
    double negative_avg_support = 0.0;
    double positive_avg_x_mean = 0.0;
    double negative_avg_x_mean = 0.0;

    int total_count() const { return positive_count + negative_count; }
};

// ---------------------------------------------------------------------------
// RuleSet — read-only snapshot of one asset's BUY and SELL rules.
// Shared by every walk-forward period of a run.
// ---------------------------------------------------------------------------
class RuleSet {
public:
    RuleSet() = default;
    RuleSet(std::vector<Rule> positive, std::vector<Rule> negative)
        : positive_(std::move(positive)), negative_(std::move(negative)) {}

    const std::vector<Rule>& positive() const { return positive_; }
    const std::vector<Rule>& negative() const { return negative_; }

    size_t size() const { return positive_.size() + negative_.size(); }
    bool empty() const { return positive_.empty() && negative_.empty(); }

    int max_lag() const {
        int m = 0;
        for (const auto& r : positive_) m = std::max(m, r.max_lag());
        for (const auto& r : negative_) m = std::max(m, r.max_lag());
        return m;
    }

    RuleSummary summary() const {
        RuleSummary s{};
        s.positive_count = static_cast<int>(positive_.size());
        s.negative_count = static_cast<int>(negative_.size());
        for (const auto& r : positive_) {
            s.positive_avg_support += r.support_count;
            s.positive_avg_x_mean += r.x_mean;
        }
        for (const auto& r : negative_) {
            s.negative_avg_support += r.support_count;
            s.negative_avg_x_mean += r.x_mean;
        }
        if (s.positive_count > 0) {
            s.positive_avg_support /= s.positive_count;
            s.positive_avg_x_mean /= s.positive_count;
        }
        if (s.negative_count > 0) {
            s.negative_avg_support /= s.negative_count;
            s.negative_avg_x_mean /= s.negative_count;
        }
        return s;
    }

private:
    std::vector<Rule> positive_;
    std::vector<Rule> negative_;
};
