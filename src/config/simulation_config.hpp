#pragma once

#include "backtest/execution_costs.hpp"
#include "backtest/walk_forward.hpp"
#include "portfolio/allocation.hpp"
#include "rules/rule_store.hpp"
#include "time_utils.hpp"

#include <stdexcept>
#include <string>

// ---------------------------------------------------------------------------
// SimulationConfig — every option recognized by a run, scoped to that run
// ---------------------------------------------------------------------------
struct SimulationConfig {
    // Rule selection
    int top_n_rules = 20;
    RuleSortKey sort_by = RuleSortKey::SUPPORT;

    // Single-asset test period start (YYYY-MM-DD)
    std::string test_start_date = "2021-01-01";

    // Walk-forward schedule
    int train_years = 5;
    int test_years = 1;
    int start_year = 2010;
    int end_year = 2025;

    // Costs as fractions
    double spread = 0.0002;
    double commission = 0.0001;
    double slippage = 0.0001;

    bool deduplicate = true;
    AllocationStrategy allocation_strategy = AllocationStrategy::EQUAL_WEIGHT;

    std::string rules_root = "output";
    std::string data_root = "forex_data/gnminer_individual";
    std::string output_dir = "results";

    ExecutionCosts costs() const {
        ExecutionCosts c{};
        c.spread = spread;
        c.commission = commission;
        c.slippage = slippage;
        return c;
    }

    WalkForwardConfig walk_forward() const {
        WalkForwardConfig wf{};
        wf.train_years = train_years;
        wf.test_years = test_years;
        wf.start_year = start_year;
        wf.end_year = end_year;
        return wf;
    }

    int test_start() const { return time_utils::parse_date(test_start_date); }

    void validate() const {
        if (top_n_rules < 0) {
            throw std::invalid_argument("top_n_rules must be non-negative, got " +
                                        std::to_string(top_n_rules));
        }
        if (test_start() == time_utils::INVALID_DATE) {
            throw std::invalid_argument("Invalid test_start_date: '" + test_start_date + "'");
        }
        costs().validate();
        walk_forward().validate();
    }
};
