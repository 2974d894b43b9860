#pragma once

#include "backtest/success_criteria.hpp"
#include "backtest/walk_forward.hpp"
#include "config/simulation_config.hpp"
#include "data/time_series_loader.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "rules/rule_store.hpp"

#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// WalkForwardRun — every period of one asset plus the aggregate and rating
// ---------------------------------------------------------------------------
struct WalkForwardRun {
    std::string asset;
    bool skipped = false;
    std::string skip_reason;
    std::vector<PeriodResult> periods;
    std::optional<WalkForwardAggregate> aggregate;
    std::optional<RobustnessAssessment> assessment;
};

// One RuleSet is loaded up front and reused by every period.
inline WalkForwardRun run_asset_walk_forward(const std::string& asset,
                                             const SimulationConfig& config) {
    WalkForwardRun run{};
    run.asset = asset;

    RuleSet rules;
    TimeSeries series;
    try {
        rules = RuleStore(config.rules_root).load_all(asset, config.top_n_rules, config.sort_by);
        series = TimeSeriesLoader(config.data_root).load(asset);
    } catch (const MissingInputError& e) {
        run.skipped = true;
        run.skip_reason = e.what();
        logging::logger()->warn("{}: walk-forward skipped: {}", asset, run.skip_reason);
        return run;
    }
    if (rules.empty()) {
        run.skipped = true;
        run.skip_reason = "No rules loaded";
        logging::logger()->warn("{}: walk-forward skipped: {}", asset, run.skip_reason);
        return run;
    }

    WalkForwardRunner runner(config.walk_forward(), config.costs(), config.deduplicate);
    run.periods = runner.run_all(rules, series);
    run.aggregate = WalkForwardRunner::aggregate(run.periods);
    if (run.aggregate) {
        run.assessment = RobustnessCriteria{}.evaluate(*run.aggregate);
        logging::logger()->info("{}: {} of {} periods completed, total return {:+.3f}%",
                                asset, run.aggregate->total_periods, run.periods.size(),
                                run.aggregate->total_return);
    } else {
        logging::logger()->warn("{}: no walk-forward period completed", asset);
    }
    return run;
}
