// walkforward.cpp — rolling train/test validation for one asset
// Generates yearly test periods, runs the rule backtest inside each one with
// the same rule set, and rates consistency, mean return and stability.

#include "backtest/backtest_result_io.hpp"
#include "config/cli_args.hpp"
#include "config/simulation_config.hpp"
#include "engine/walk_forward_run.hpp"
#include "logging.hpp"
#include "time_utils.hpp"

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
              << cli::common_usage();
}

void print_periods(const WalkForwardRun& run) {
    std::printf("\n%-7s %-6s %-11s %7s %9s %11s %11s\n",
                "Period", "Year", "Status", "Trades", "WinRate", "Return", "MaxDD");
    for (const auto& pr : run.periods) {
        if (pr.completed()) {
            std::printf("%-7d %-6d %-11s %7d %8.2f%% %+10.3f%% %+10.3f%%\n",
                        pr.period.index, pr.period.test_year, period_status_str(pr.status),
                        pr.result.total_trades, pr.result.win_rate * 100.0,
                        pr.result.total_return, pr.result.max_drawdown);
        } else {
            std::printf("%-7d %-6d %-11s  (%s)\n", pr.period.index, pr.period.test_year,
                        period_status_str(pr.status), pr.skip_reason.c_str());
        }
    }
}

void print_aggregate(const WalkForwardAggregate& agg, const RobustnessAssessment& a) {
    std::printf("\nAggregate (%d completed, %d skipped)\n", agg.total_periods, agg.skipped_periods);
    std::printf("Win Periods:        %d / %d (%.1f%%)\n",
                agg.win_periods, agg.total_periods, agg.consistency * 100.0);
    std::printf("Total Return:       %+.3f%%\n", agg.total_return);
    std::printf("Avg Return/Period:  %+.3f%%\n", agg.avg_return);
    std::printf("Std of Returns:     %.3f%%\n", agg.std_return);
    std::printf("Best / Worst:       %+.3f%% / %+.3f%%\n",
                agg.best_period_return, agg.worst_period_return);
    std::printf("Total Trades:       %d\n", agg.total_trades);
    std::printf("Avg Win Rate:       %.2f%%\n", agg.avg_win_rate * 100.0);
    std::printf("Avg Max Drawdown:   %+.3f%%\n", agg.avg_max_drawdown);
    std::printf("\nConsistency: %s   Return: %s   Stability: %s\n",
                a.consistency_rating.c_str(), a.return_rating.c_str(),
                a.stability_rating.c_str());
    std::printf("Verdict: %s\n", a.verdict.c_str());
}

std::string summary_text(const WalkForwardRun& run, const SimulationConfig& cfg) {
    std::ostringstream ss;
    ss << "Walk-forward Summary: " << run.asset << "\n";
    ss << "Train " << cfg.train_years << "y, test " << cfg.test_years << "y, years "
       << cfg.start_year << "-" << cfg.end_year << "\n";
    ss << "Periods: " << run.periods.size() << "\n";
    if (run.aggregate) {
        const auto& agg = *run.aggregate;
        ss << "Completed periods: " << agg.total_periods << "\n";
        ss << "Skipped periods: " << agg.skipped_periods << "\n";
        ss << "Total return: " << agg.total_return << "%\n";
        ss << "Average return: " << agg.avg_return << "%\n";
        ss << "Std of returns: " << agg.std_return << "%\n";
        ss << "Consistency: " << agg.consistency * 100.0 << "%\n";
        ss << "Verdict: " << run.assessment->verdict << "\n";
    } else {
        ss << "No period completed\n";
    }
    return ss.str();
}

}  // namespace

int main(int argc, char* argv[]) {
    SimulationConfig cfg{};
    std::string asset;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (cli::parse_common_option(i, argc, argv, cfg)) continue;
            if (arg == "--verbose") {
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
        auto run = run_asset_walk_forward(asset, cfg);
        if (run.skipped) {
            std::cerr << "ERROR: " << asset << ": " << run.skip_reason << "\n";
            return 1;
        }

        std::printf("\n================================================================\n");
        std::printf("Walk-forward Analysis: %s\n", asset.c_str());
        std::printf("================================================================\n");
        for (const auto& pr : run.periods) {
            std::printf("Period %2d: Train [%s to %s] -> Test [%s to %s]\n", pr.period.index,
                        time_utils::date_to_string(pr.period.train_start).c_str(),
                        time_utils::date_to_string(pr.period.train_end).c_str(),
                        time_utils::date_to_string(pr.period.test_start).c_str(),
                        time_utils::date_to_string(pr.period.test_end).c_str());
        }
        print_periods(run);

        auto dir = std::filesystem::path(cfg.output_dir) / asset;
        backtest_io::write_file((dir / (asset + "_walkforward_periods.csv")).string(),
                                backtest_io::periods_csv(run.periods));
        backtest_io::write_file((dir / (asset + "_walkforward_summary.txt")).string(),
                                summary_text(run, cfg));
        backtest_io::write_file((dir / (asset + "_walkforward.json")).string(),
                                backtest_io::to_json(run.periods, run.aggregate, run.assessment));

        if (!run.aggregate) {
            std::cerr << "ERROR: no walk-forward period produced trades\n";
            return 1;
        }
        print_aggregate(*run.aggregate, *run.assessment);
        std::printf("\nResults saved to: %s\n", dir.string().c_str());
    } catch (const std::runtime_error& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
