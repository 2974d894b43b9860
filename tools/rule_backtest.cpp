// rule_backtest.cpp — single-asset out-of-sample rule backtest
// Loads the top mined rules for one asset, scans every row dated on or after
// --test-start, simulates one-period trades net of costs and writes a summary,
// per-rule statistics and (optionally) the trade list.

#include "backtest/backtest_result_io.hpp"
#include "backtest/rule_performance.hpp"
#include "config/cli_args.hpp"
#include "config/simulation_config.hpp"
#include "engine/asset_backtest.hpp"
#include "io/parquet_writer.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <asset> [options]\n"
              << "\n"
              << cli::common_usage()
              << "  --save-trades       Also write the trade list (CSV + Parquet)\n";
}

void print_stats(const AssetRunResult& run, const SimulationConfig& cfg) {
    const auto& r = run.result;
    std::printf("\n================================================================\n");
    std::printf("Trade Statistics: %s\n", run.asset.c_str());
    std::printf("================================================================\n");
    std::printf("Rules:                %d BUY + %d SELL\n",
                run.rules.positive_count, run.rules.negative_count);
    std::printf("Test period:          %s onwards (rows %d..%d of %d)\n",
                cfg.test_start_date.c_str(), run.window.begin, run.window.end,
                run.series_rows);
    std::printf("Signals:              %d%s\n", run.signal_count,
                cfg.deduplicate ? " (1 per timestamp)" : "");
    std::printf("Total Trades:         %6d\n", r.total_trades);
    std::printf("  BUY trades:         %6d\n", r.buy_trades);
    std::printf("  SELL trades:        %6d\n", r.sell_trades);
    std::printf("Wins / Losses:        %6d / %d\n", r.winning_trades, r.losing_trades);
    std::printf("Win Rate:             %6.2f%%\n", r.win_rate * 100.0);
    std::printf("Total Return (gross): %+.3f%%\n", r.total_return_before_cost);
    std::printf("Total Return (net):   %+.3f%%\n", r.total_return);
    std::printf("Cost paid:            %.3f%%\n", r.total_cost);
    std::printf("Avg Profit:           %+.4f%%\n", r.avg_profit);
    std::printf("Avg Win / Avg Loss:   %+.4f%% / %+.4f%%\n", r.avg_win, r.avg_loss);
    std::printf("Max Win / Max Loss:   %+.4f%% / %+.4f%%\n", r.max_win, r.max_loss);
    std::printf("Profit Factor:        %.3f\n", r.profit_factor);
    std::printf("Sharpe:               %.4f\n", r.sharpe);
    std::printf("Max Drawdown:         %+.3f%%\n", r.max_drawdown);
    std::printf("BUY:  win %.2f%%  avg %+.4f%%  total %+.3f%%\n",
                r.buy_win_rate * 100.0, r.buy_avg_profit, r.buy_total_return);
    std::printf("SELL: win %.2f%%  avg %+.4f%%  total %+.3f%%\n",
                r.sell_win_rate * 100.0, r.sell_avg_profit, r.sell_total_return);
}

void print_rule_performance(const std::vector<RulePerformance>& stats, size_t top_n) {
    std::printf("\n%-8s %-5s %7s %9s %12s %12s  %s\n",
                "Rule", "Side", "Trades", "WinRate", "AvgProfit", "TotalReturn", "Conditions");
    for (size_t i = 0; i < std::min(top_n, stats.size()); ++i) {
        const auto& s = stats[i];
        std::printf("%-8d %-5s %7d %8.2f%% %+11.4f%% %+11.3f%%  %s\n",
                    s.rule_id, side_str(s.side), s.trade_count, s.win_rate * 100.0,
                    s.avg_profit, s.total_return, s.rule_text.c_str());
    }
}

std::string summary_text(const AssetRunResult& run, const SimulationConfig& cfg) {
    const auto& r = run.result;
    std::ostringstream ss;
    ss << "Simulation Summary\n";
    ss << "Settings:\n";
    ss << "  Asset: " << run.asset << "\n";
    ss << "  Rules: " << cfg.top_n_rules << " per direction, sort " << sort_key_str(cfg.sort_by) << "\n";
    ss << "  Test period: " << cfg.test_start_date << " onwards\n";
    ss << "  Deduplication: " << (cfg.deduplicate ? "true" : "false") << "\n";
    ss << "  Transaction cost: " << cfg.costs().round_trip_cost_pct() << "%\n";
    ss << "Results:\n";
    ss << "  Total trades: " << r.total_trades << "\n";
    ss << "  Win rate: " << r.win_rate * 100.0 << "%\n";
    ss << "  Total return (before cost): " << r.total_return_before_cost << "%\n";
    ss << "  Total return (after cost): " << r.total_return << "%\n";
    ss << "  Cost impact: " << r.total_return_before_cost - r.total_return << "%\n";
    ss << "  Max drawdown: " << r.max_drawdown << "%\n";
    return ss.str();
}

}  // namespace

int main(int argc, char* argv[]) {
    SimulationConfig cfg{};
    std::string asset;
    bool save_trades = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (cli::parse_common_option(i, argc, argv, cfg)) continue;
            if (arg == "--save-trades") {
                save_trades = true;
            } else if (arg == "--verbose") {
                logging::logger()->set_level(spdlog::level::debug);
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (!arg.empty() && arg[0] != '-' && asset.empty()) {
                asset = arg;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
        cfg.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }
    if (asset.empty()) {
        std::cerr << "Missing required argument: <asset>\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto run = run_asset_backtest(asset, cfg);
        if (run.skipped) {
            std::cerr << "ERROR: " << asset << ": " << run.skip_reason << "\n";
            return 1;
        }

        print_stats(run, cfg);
        auto rule_stats = backtest_util::rule_performance(run.result.trades);
        print_rule_performance(rule_stats, 20);

        auto dir = std::filesystem::path(cfg.output_dir) / asset;
        auto out = [&dir, &asset](const std::string& suffix) {
            return (dir / (asset + suffix)).string();
        };
        backtest_io::write_file(out("_summary.txt"), summary_text(run, cfg));
        backtest_io::write_file(out("_rule_stats.csv"), backtest_io::rule_performance_csv(rule_stats));
        backtest_io::write_file(out("_result.json"), backtest_io::to_json(run.result, save_trades));
        if (save_trades) {
            backtest_io::write_file(out("_trades.csv"), backtest_io::trades_csv(run.result.trades));
            parquet_io::write_trades(run.result.trades, out("_trades.parquet"));
        }
        std::printf("\nResults saved to: %s\n", dir.string().c_str());
    } catch (const std::runtime_error& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
