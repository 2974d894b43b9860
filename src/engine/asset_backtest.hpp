#pragma once

#include "backtest/signal_generator.hpp"
#include "backtest/trade_simulator.hpp"
#include "config/simulation_config.hpp"
#include "data/time_series_loader.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "rules/rule_store.hpp"

#include <string>

// ---------------------------------------------------------------------------
// AssetRunResult — one asset's out-of-sample backtest, or why it was skipped
// ---------------------------------------------------------------------------
struct AssetRunResult {
    std::string asset;
    bool skipped = false;
    std::string skip_reason;
    RuleSummary rules;
    int series_rows = 0;
    IndexWindow window;
    int signal_count = 0;
    BacktestResult result;
};

// ---------------------------------------------------------------------------
// Loads rules and data for `asset` and backtests every row dated on or after
// config.test_start_date. Missing inputs and empty outcomes mark the result
// skipped; malformed inputs still throw.
// ---------------------------------------------------------------------------
inline AssetRunResult run_asset_backtest(const std::string& asset,
                                         const SimulationConfig& config) {
    AssetRunResult run{};
    run.asset = asset;

    auto mark_skipped = [&run](const std::string& reason) {
        run.skipped = true;
        run.skip_reason = reason;
        logging::logger()->warn("{}: skipped: {}", run.asset, reason);
    };

    RuleSet rules;
    TimeSeries series;
    try {
        rules = RuleStore(config.rules_root).load_all(asset, config.top_n_rules, config.sort_by);
        series = TimeSeriesLoader(config.data_root).load(asset);
    } catch (const MissingInputError& e) {
        mark_skipped(e.what());
        return run;
    }
    run.rules = rules.summary();
    run.series_rows = series.size();

    if (rules.empty()) {
        mark_skipped("No rules loaded");
        return run;
    }

    run.window = series.index_from(config.test_start());
    auto signals = SignalGenerator().generate(rules, series, run.window, config.deduplicate);
    run.signal_count = static_cast<int>(signals.size());
    if (signals.empty()) {
        mark_skipped("No signals generated");
        return run;
    }

    run.result = TradeSimulator(config.costs()).run(signals, series);
    if (run.result.empty()) {
        mark_skipped("No trades executed");
        return run;
    }
    return run;
}
