#pragma once

#include "backtest/walk_forward.hpp"

#include <cmath>
#include <string>

// ---------------------------------------------------------------------------
// RobustnessAssessment — rating of a walk-forward aggregate
// ---------------------------------------------------------------------------
struct RobustnessAssessment {
    double consistency = 0.0;
    double avg_return = 0.0;
    double std_return = 0.0;

    std::string consistency_rating = "Poor";
    std::string return_rating = "Poor";
    std::string stability_rating = "Poor";

    bool passed = false;
    std::string verdict = "FAIL";
};

// ---------------------------------------------------------------------------
// RobustnessCriteria — thresholds over period consistency, mean and spread
// ---------------------------------------------------------------------------
struct RobustnessCriteria {
    double excellent_consistency = 0.70;
    double good_consistency = 0.50;
    double good_avg_return = 2.0;
    double fair_avg_return = 0.0;
    double good_std = 5.0;
    double fair_std = 10.0;

    RobustnessAssessment evaluate(const WalkForwardAggregate& agg) const {
        RobustnessAssessment a{};
        a.consistency = agg.consistency;
        a.avg_return = agg.avg_return;
        a.std_return = agg.std_return;

        a.consistency_rating = agg.consistency >= excellent_consistency ? "Excellent"
                             : agg.consistency >= good_consistency      ? "Good"
                                                                        : "Poor";
        a.return_rating = agg.avg_return >= good_avg_return ? "Good"
                        : agg.avg_return >= fair_avg_return ? "Fair"
                                                            : "Poor";
        a.stability_rating = agg.std_return < good_std ? "Good"
                           : agg.std_return < fair_std ? "Fair"
                                                       : "Poor";

        if (agg.consistency >= excellent_consistency && agg.avg_return >= good_avg_return) {
            a.verdict = "PASS";
            a.passed = true;
        } else if (agg.consistency >= good_consistency || agg.avg_return >= fair_avg_return) {
            a.verdict = "MARGINAL";
        } else {
            a.verdict = "FAIL";
        }
        return a;
    }
};

// ---------------------------------------------------------------------------
// PortfolioGrade — quality band of a combined portfolio
// ---------------------------------------------------------------------------
enum class PortfolioGrade { EXCELLENT, GOOD, MARGINAL, POOR };

inline const char* portfolio_grade_str(PortfolioGrade g) {
    switch (g) {
        case PortfolioGrade::EXCELLENT: return "EXCELLENT";
        case PortfolioGrade::GOOD:      return "GOOD";
        case PortfolioGrade::MARGINAL:  return "MARGINAL";
        case PortfolioGrade::POOR:      return "POOR";
    }
    return "UNKNOWN";
}

struct PortfolioGradeCriteria {
    double excellent_return = 50.0;
    double excellent_sharpe = 1.0;
    double excellent_max_dd = 20.0;
    double good_return = 30.0;
    double good_sharpe = 0.5;
    double good_max_dd = 30.0;
    double marginal_return = 15.0;
    double marginal_sharpe = 0.3;

    // total_return and max_drawdown in percent; drawdown may be signed.
    PortfolioGrade evaluate(double total_return, double sharpe, double max_drawdown) const {
        double dd = std::abs(max_drawdown);
        if (total_return > excellent_return && sharpe > excellent_sharpe && dd < excellent_max_dd) {
            return PortfolioGrade::EXCELLENT;
        }
        if (total_return > good_return && sharpe > good_sharpe && dd < good_max_dd) {
            return PortfolioGrade::GOOD;
        }
        if (total_return > marginal_return && sharpe > marginal_sharpe) {
            return PortfolioGrade::MARGINAL;
        }
        return PortfolioGrade::POOR;
    }
};
